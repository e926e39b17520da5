#pragma once

#include "limitrace_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序，并在 stderr 末尾输出统计信息
 * @note 该函数必须在 main 函数最后调用
 * 1. 调用 fork 创建子进程
 *    1. 子进程分离到一个独立的进程组，以便通过 SIGKILL 杀死进程组内所有进程
 *    2. 通过 rlimit 限制 CPU time，然后 execvp 运行命令；标准输入输出直接继承
 * 2. 父进程每隔一小段时间调用 wait4(WNOHANG) 检查子进程是否结束，同时
 *    1. 读取 /proc/<pid>/status 采样 RSS 和虚拟内存，超限时杀死进程组
 *    2. 检查墙上时间，超时时杀死进程组
 * 3. 子进程结束后杀死进程组内残留的进程
 * 4. 根据 rusage 和采样结果计算超限标记，向 stderr 输出统计信息
 * @return 子进程的退出码，被信号杀死时为 128 + 信号
 */
int runit(const struct limitrace_options &opt);
