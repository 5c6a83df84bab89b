// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include "ask/autocomplete.hpp"
#include "ask/date.hpp"
#include "ask/error.hpp"
#include "ask/formatter.hpp"
#include "ask/list_option.hpp"
#include "ask/render_config.hpp"
#include "ask/scorer.hpp"
#include "ask/validator.hpp"
#include "ask/prompts/confirm.hpp"
#include "ask/prompts/custom_type.hpp"
#include "ask/prompts/date_select.hpp"
#include "ask/prompts/editor.hpp"
#include "ask/prompts/multi_count.hpp"
#include "ask/prompts/multi_select.hpp"
#include "ask/prompts/password.hpp"
#include "ask/prompts/path_select.hpp"
#include "ask/prompts/reorder.hpp"
#include "ask/prompts/select.hpp"
#include "ask/prompts/text.hpp"
