// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdio>

inline void noDataError()
{
  fprintf(stderr, "No data, aborting.\n");
  fprintf(stderr, "Provide the data set for the benchmark over stdin, one option per line.\n");
  fprintf(stderr, "\n");
  fprintf(stderr, "For example:\n");
  fprintf(stderr, "find /usr/share | ask-bench --filter doc\n");
}
