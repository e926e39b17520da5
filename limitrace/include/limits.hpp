#pragma once

#include <sys/types.h>
#include <cstdint>
#include <vector>
#include "limitrace_options.hpp"

/**
 * Limit current process resources usage.
 *
 * Called in the forked child right before exec.
 */
void set_restrictions(const struct limitrace_options &opt);

/**
 * Move the current process into a new user and network namespace
 * which contains only a loopback device.
 *
 * Must be called before any child is forked.
 */
void isolate_network();

struct memory_sample {
    int64_t rss_bytes = 0;  // VmRSS
    int64_t as_bytes = 0;   // VmSize
};

/**
 * Read current memory usage of a process from /proc/<pid>/status.
 *
 * Returns false if the process has gone (or is a zombie without memory info).
 */
bool sample_memory(pid_t pid, memory_sample &sample);

/**
 * All living (or not yet reaped) descendants of root, found by walking
 * the parent links in /proc/<pid>/stat.
 */
std::vector<pid_t> list_descendants(pid_t root);

/**
 * Sum of the memory usage of all descendants of root.
 */
memory_sample sample_descendants(pid_t root);
