#include "run.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <system_error>
#include "harness/statistics.hpp"
#include "limits.hpp"

using namespace std;

const struct timespec polldelay = {0, 5000000L};  // 5ms

static volatile pid_t child_pid = -1;

template <typename... Args>
[[noreturn]] void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

/**
 * 收到 SIGTERM 时杀死整个进程组后退出，不输出统计信息
 */
static void terminate(int sig) {
    if (child_pid > 0) kill(-child_pid, SIGKILL);
    _exit(128 + sig);
}

/**
 * 向进程组以及所有后代进程发送 SIGKILL。
 * 后代进程可能通过 setsid 脱离进程组，因此需要遍历进程树。
 */
static void kill_descendants(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to kill process group " << pid << ": " << strerror(errno);
    for (pid_t descendant : list_descendants(getpid()))
        if (kill(descendant, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to kill process " << descendant << ": " << strerror(errno);
}

static void kill_tree(pid_t pid, const char *reason) {
    LOG(WARNING) << reason << ": aborting command";
    kill_descendants(pid);
}

/**
 * 回收所有已经结束的子进程（包括被本进程收养的孤儿进程）。
 * @return 命令进程本身是否已经结束，结束状态写入 status
 */
static bool reap_children(pid_t pid, int &status) {
    bool finished = false;
    while (true) {
        int st;
        pid_t r = waitpid(-1, &st, WNOHANG);
        if (r == 0) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            if (errno == ECHILD) break;
            error(errno, "waiting on children");
        }
        if (r == pid) status = st, finished = true;
    }
    return finished;
}

/**
 * 命令结束后，杀死并回收残留的全部后代进程，之后才允许输出统计信息
 */
static void clean_up(pid_t pid) {
    while (true) {
        vector<pid_t> remaining = list_descendants(getpid());
        if (remaining.empty()) break;
        kill_descendants(pid);

        int st;
        while (waitpid(-1, &st, WNOHANG) > 0)
            ;
        nanosleep(&polldelay, nullptr);
    }

    int st;
    while (waitpid(-1, &st, 0) > 0 || errno == EINTR)
        ;
}

static int64_t to_usec(const struct timeval &tv) {
    return (int64_t)tv.tv_sec * 1000000 + tv.tv_usec;
}

int runit(const struct limitrace_options &opt) {
    {
        struct sigaction sigact;
        sigact.sa_handler = terminate;
        sigact.sa_flags = SA_RESETHAND;
        if (sigemptyset(&sigact.sa_mask) != 0) error(errno, "creating empty signal mask");
        if (sigaction(SIGTERM, &sigact, nullptr) != 0) error(errno, "installing signal handler");
    }

    // 成为 subreaper，命令产生的孤儿进程会被本进程收养，不会逃出监控范围
    if (prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0) error(errno, "becoming child subreaper");

    if (opt.disable_network) isolate_network();

    vector<char *> args;
    for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    auto start = chrono::steady_clock::now();

    pid_t pid = fork();
    switch (pid) {
        case -1:
            error(errno, "unable to fork");
        case 0: {  // child process, run the command
            setpgid(0, 0);
            try {
                set_restrictions(opt);
            } catch (system_error &e) {
                cerr << e.what() << endl;
                _exit(127);
            }
            execvp(args[0], args.data());
            cerr << "unable to start command " << args[0] << ": " << strerror(errno) << endl;
            _exit(127);
        }
        default:
            break;
    }

    child_pid = pid;
    setpgid(pid, pid);

    bool wall_killed = false, rss_killed = false, as_killed = false;
    int64_t peak_rss = 0;
    int status = 0;

    while (!reap_children(pid, status)) {
        if (wall_killed || rss_killed || as_killed) {
            // 已经发送过 SIGKILL，继续清理新出现的后代进程直到命令结束
            kill_descendants(pid);
            nanosleep(&polldelay, nullptr);
            continue;
        }

        memory_sample sample = sample_descendants(getpid());
        peak_rss = max(peak_rss, sample.rss_bytes);
        if (opt.memory_limit >= 0 && sample.rss_bytes > opt.memory_limit) {
            rss_killed = true;
            kill_tree(pid, "memory limit exceeded (rss)");
            continue;
        }
        if (opt.as_limit >= 0 && sample.as_bytes > opt.as_limit) {
            as_killed = true;
            kill_tree(pid, "memory limit exceeded (address space)");
            continue;
        }

        if (opt.use_wall_limit) {
            double elapsed = chrono::duration<double>(chrono::steady_clock::now() - start).count();
            if (elapsed > opt.wall_limit) {
                wall_killed = true;
                kill_tree(pid, fmt::format("timelimit exceeded (wall time {:.3f}s)", elapsed).c_str());
                continue;
            }
        }

        nanosleep(&polldelay, nullptr);
    }

    auto wall_time = chrono::duration_cast<chrono::microseconds>(chrono::steady_clock::now() - start).count();

    // 杀死所有残留的后代进程，确保它们不会留驻系统，也不会在统计信息之后继续输出
    clean_up(pid);
    child_pid = -1;

    int exitcode;
    bool cpu_signaled = false;
    if (WIFEXITED(status)) {
        exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        exitcode = sig + 128;
        if (sig == SIGXCPU) {
            cpu_signaled = true;
            LOG(WARNING) << "Time Limit Exceeded (cpu rlimit)";
        } else {
            LOG(WARNING) << "Command terminated with signal (" << sig << ", " << strsignal(sig) << ")";
        }
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    // 所有后代进程均已回收，RUSAGE_CHILDREN 包含整棵进程树的资源使用
    struct rusage usage;
    if (getrusage(RUSAGE_CHILDREN, &usage) != 0) error(errno, "reading resource usage of children");

    grader::resource_statistics stats;
    stats.ru_utime_usec = to_usec(usage.ru_utime);
    stats.ru_stime_usec = to_usec(usage.ru_stime);
    stats.wall_time_usec = wall_time;
    stats.ru_maxrss = max<int64_t>(usage.ru_maxrss, peak_rss / 1024);
    stats.ru_minflt = usage.ru_minflt;
    stats.ru_majflt = usage.ru_majflt;
    stats.ru_inblock = usage.ru_inblock;
    stats.ru_oublock = usage.ru_oublock;
    stats.ru_nvcsw = usage.ru_nvcsw;
    stats.ru_nivcsw = usage.ru_nivcsw;

    int64_t cpu_limit_usec = opt.use_cpu_limit ? (int64_t)(opt.cpu_limit * 1e6) : -1;

    grader::limit_detection detection;
    if (cpu_limit_usec >= 0) {
        detection.utime_overuse = stats.ru_utime_usec > cpu_limit_usec;
        detection.stime_overuse = stats.ru_stime_usec > cpu_limit_usec;
    }
    detection.cpu_overuse = cpu_signaled || wall_killed ||
                            (cpu_limit_usec >= 0 && stats.ru_utime_usec + stats.ru_stime_usec > cpu_limit_usec);
    detection.rss_overuse = rss_killed || (opt.memory_limit >= 0 && stats.ru_maxrss * 1024 > opt.memory_limit);
    detection.as_overuse = as_killed;
    detection.memory_overuse = detection.rss_overuse || detection.as_overuse;
    detection.exit_status = exitcode;

    LOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}, maxrss {}KiB",
                             wall_time / 1e6, stats.ru_utime_usec / 1e6, stats.ru_stime_usec / 1e6, stats.ru_maxrss);

    cerr << endl
         << grader::make_trailer(stats, detection) << flush;

    return exitcode;
}
