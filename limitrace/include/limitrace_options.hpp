#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct limitrace_options {
    bool use_wall_limit = false;
    double wall_limit = 0;  // wall clock time in seconds

    bool use_cpu_limit = false;
    double cpu_limit = 0;  // user + system CPU time in seconds

    int64_t memory_limit = -1;  // resident set size limit in bytes, summed over all descendants
    int64_t as_limit = -1;      // address space limit in bytes, summed over all descendants

    int cpus = 0;                  // number of CPUs the command may run on, 0 for no restriction
    bool disable_network = false;  // run the command in an empty network namespace

    std::vector<std::string> command;
};
