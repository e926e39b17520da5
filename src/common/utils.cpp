#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <system_error>
using namespace std;

int exec_program(const char **argv) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0: {  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            execvp(argv[0], (char **)argv);
            _exit(127);
        }
        default:  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0)
                if (errno != EINTR) throw system_error(errno, system_category(), "waitpid");
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                return 128 + WTERMSIG(status);
            else
                return -1;
    }
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    if (setenv(key.c_str(), value.c_str(), replace) != 0)
        throw system_error(errno, system_category(), "setenv " + key);
}

elapsed_time::elapsed_time() : start(chrono::steady_clock::now()) {}
