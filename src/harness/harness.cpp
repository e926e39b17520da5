#include "harness/harness.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <algorithm>
#include <chrono>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

extern char **environ;

namespace grader {
using namespace std;
using json = nlohmann::json;

const struct timespec killdelay = {0, 100000000L};  // 0.1s
const struct timespec polldelay = {0, 10000000L};   // 10ms

const int64_t POLL_INTERVAL_MS = 50;

// limitrace 退出后最多再读取的次数，管道容量为 64KiB
const int MAX_DRAIN_READS = 64;

// 只保留 stderr 末尾的这么多字节用于解析统计信息
const size_t STDERR_TAIL_SIZE = 64 * 1024;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

template <typename... Args>
[[noreturn]] static void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

void to_json(json &j, const execution_result &result) {
    j = {{"exit_status", result.exit_status},
         {"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"statistics", result.statistics},
         {"detection", result.detection},
         {"failed", result.failed},
         {"error_message", result.error_message},
         {"skipped", result.skipped}};
}

void from_json(const json &j, harness_config &config) {
    if (j.count("limitrace"))
        config.limitrace = j.at("limitrace").get<string>();
    if (j.count("grace_usec"))
        j.at("grace_usec").get_to(config.grace_usec);
    if (j.count("address_space_limit"))
        j.at("address_space_limit").get_to(config.address_space_limit);
    if (j.count("max_output_size"))
        j.at("max_output_size").get_to(config.max_output_size);
    if (j.count("environment_root"))
        config.environment_root = j.at("environment_root").get<string>();
}

harness::harness(harness_config config) : cfg(move(config)) {}

static string format_seconds(int64_t usec) {
    return fmt::format("{:.6f}", usec / 1e6);
}

enum class pipe_state { data, empty, closed };

/**
 * @brief 从管道中读取数据
 * stdout 超过 max_size 的部分直接丢弃；stderr 保留开头 max_size 字节和末尾 STDERR_TAIL_SIZE 字节，
 * 因为 limitrace 的统计信息总是在 stderr 末尾
 */
static pipe_state pump_pipe(int fd, string &buffer, size_t max_size, bool keep_tail, bool &truncated) {
    char buf[BUF_SIZE];
    ssize_t nread = read(fd, buf, BUF_SIZE);
    if (nread < 0) {
        if (errno == EINTR) return pipe_state::data;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return pipe_state::empty;
        error(errno, "reading from child pipe");
    }
    if (nread == 0) return pipe_state::closed;

    if (!keep_tail) {
        if (buffer.size() < max_size)
            buffer.append(buf, min((size_t)nread, max_size - buffer.size()));
        if (buffer.size() >= max_size) truncated = true;
    } else {
        buffer.append(buf, nread);
        if (buffer.size() > max_size + 2 * STDERR_TAIL_SIZE) {
            buffer.erase(max_size, buffer.size() - max_size - STDERR_TAIL_SIZE);
            truncated = true;
        }
    }
    return pipe_state::data;
}

/**
 * @brief 构造子进程的环境变量，运行环境的 bin 目录放在 PATH 最前面
 */
static vector<string> make_environment(const harness_config &cfg, const optional<runtime_environment> &env) {
    vector<string> result;
    string path;
    for (char **p = environ; *p; ++p) {
        string entry = *p;
        if (env && entry.rfind("PATH=", 0) == 0) path = entry.substr(5);
        else if (!env || entry.rfind("VIRTUAL_ENV=", 0) != 0) result.push_back(move(entry));
    }
    if (!env) return result;

    filesystem::path dir = cfg.environment_root / env->name / env->version;
    if (!filesystem::is_directory(dir / "bin"))
        throw internal_error(fmt::format("runtime environment {} {} is not installed in {}", env->name, env->version, dir.string()));

    result.push_back("PATH=" + (dir / "bin").string() + (path.empty() ? "" : ":" + path));
    result.push_back("VIRTUAL_ENV=" + dir.string());
    return result;
}

execution_result harness::run(const vector<string> &argv, const filesystem::path &workdir, const resource_limits &limits) {
    if (argv.empty())
        throw internal_error("empty command");
    if (!filesystem::exists(cfg.limitrace))
        throw internal_error(fmt::format("limitrace executable {} does not exist", cfg.limitrace.string()));
    if (limits.time_limit_usec <= 0 || limits.time_limit_usec > MAX_TIME_LIMIT_USEC ||
        limits.cpu_limit_usec <= 0 || limits.cpu_limit_usec > MAX_TIME_LIMIT_USEC)
        throw internal_error(fmt::format("time limit out of range: wall {}us, cpu {}us", limits.time_limit_usec, limits.cpu_limit_usec));

    vector<string> args = {
        cfg.limitrace.string(),
        "--wall-time", format_seconds(limits.time_limit_usec),
        "--cpu-time", format_seconds(limits.cpu_limit_usec),
        "--memory-limit", to_string(limits.memory_limit_bytes)};
    if (cfg.address_space_limit > 0) {
        args.push_back("--as-limit");
        args.push_back(to_string(cfg.address_space_limit));
    }
    if (limits.cpu_count > 0) {
        args.push_back("--cpus");
        args.push_back(to_string(limits.cpu_count));
    }
    if (!limits.network_access)
        args.push_back("--no-network");
    args.push_back("--");
    args.insert(args.end(), argv.begin(), argv.end());

    vector<char *> cargs;
    for (auto &arg : args) cargs.push_back(arg.data());
    cargs.push_back(nullptr);

    vector<string> envs = make_environment(cfg, limits.environment);
    vector<char *> cenvs;
    for (auto &env : envs) cenvs.push_back(env.data());
    cenvs.push_back(nullptr);

    int child_pipefd[3][2];
    for (int i = 1; i <= 2; i++)
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int i = 1; i <= 2; i++) close(child_pipefd[i][PIPE_IN]), close(child_pipefd[i][PIPE_OUT]);
        error(err, "unable to fork");
    }

    if (pid == 0) {
        // 子进程独立成一个进程组，超时后可以整组杀死
        setpgid(0, 0);
        signal(SIGINT, SIG_IGN);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) _exit(127);
        for (int i = 1; i <= 2; ++i)
            if (dup2(child_pipefd[i][PIPE_IN], i) < 0) _exit(127);
        if (chdir(workdir.c_str()) != 0) {
            dprintf(STDERR_FILENO, "unable to change directory to %s\n", workdir.c_str());
            _exit(127);
        }
        execve(cargs[0], cargs.data(), cenvs.data());
        dprintf(STDERR_FILENO, "unable to start %s\n", cargs[0]);
        _exit(127);
    }

    setpgid(pid, pid);
    for (int i = 1; i <= 2; i++)
        if (close(child_pipefd[i][PIPE_IN]) != 0) error(errno, "closing pipe for fd {}", i);
    int fds[3] = {-1, child_pipefd[1][PIPE_OUT], child_pipefd[2][PIPE_OUT]};
    defer {
        for (int i = 1; i <= 2; i++)
            if (fds[i] >= 0) close(fds[i]);
    };
    for (int i = 1; i <= 2; i++)
        if (fcntl(fds[i], F_SETFL, fcntl(fds[i], F_GETFL) | O_NONBLOCK) != 0)
            error(errno, "setting pipe for fd {} non-blocking", i);

    auto start = chrono::steady_clock::now();
    auto deadline = start + chrono::microseconds(limits.time_limit_usec + cfg.grace_usec);

    string output[3];
    bool truncated[3] = {false, false, false};
    bool timed_out = false;
    int status = 0;

    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r < 0 && errno != EINTR) error(errno, "waiting on limitrace");
        if (r == pid) break;

        auto now = chrono::steady_clock::now();
        if (!timed_out && now >= deadline) {
            // limitrace 没有在时间限制内结束，先 SIGTERM 让它清理进程组，再 SIGKILL
            LOG(WARNING) << "limitrace " << pid << " outlived the wall time limit, killing";
            timed_out = true;
            if (kill(pid, SIGTERM) != 0 && errno != ESRCH) error(errno, "sending SIGTERM to limitrace");
            nanosleep(&killdelay, nullptr);
            if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) error(errno, "sending SIGKILL to limitrace");
            while (waitpid(pid, &status, 0) < 0)
                if (errno != EINTR) error(errno, "waiting on limitrace");
            break;
        }

        // 每次最多等待 POLL_INTERVAL，以便及时发现 limitrace 已经退出
        int timeout = (int)clamp<int64_t>(chrono::duration_cast<chrono::milliseconds>(deadline - now).count(), 1, POLL_INTERVAL_MS);

        struct pollfd pfds[2];
        int nfds = 0, index[2];
        for (int i = 1; i <= 2; i++)
            if (fds[i] >= 0) {
                pfds[nfds].fd = fds[i];
                pfds[nfds].events = POLLIN;
                pfds[nfds].revents = 0;
                index[nfds++] = i;
            }

        if (nfds == 0) {
            nanosleep(&polldelay, nullptr);
            continue;
        }

        int ready = poll(pfds, nfds, timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }
        for (int k = 0; k < nfds; ++k) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int i = index[k];
            if (pump_pipe(fds[i], output[i], cfg.max_output_size, i == STDERR_FILENO, truncated[i]) == pipe_state::closed) {
                if (close(fds[i]) != 0) error(errno, "closing pipe for fd {}", i);
                fds[i] = -1;
            }
        }
    }

    // limitrace 已经退出，统计信息已经全部写入管道。
    // 只读取管道中现有的数据，之后仍然持有管道写端的进程输出的内容一律丢弃
    for (int i = 1; i <= 2; i++) {
        for (int reads = 0; fds[i] >= 0; ++reads) {
            pipe_state state = pump_pipe(fds[i], output[i], cfg.max_output_size, i == STDERR_FILENO, truncated[i]);
            if (state == pipe_state::data && reads < MAX_DRAIN_READS) continue;
            if (close(fds[i]) != 0) error(errno, "closing pipe for fd {}", i);
            fds[i] = -1;
        }
    }

    auto elapsed = chrono::duration_cast<chrono::microseconds>(chrono::steady_clock::now() - start).count();
    DLOG(INFO) << fmt::format("limitrace {} finished in {:.3f}s with status {:x}", pid, elapsed / 1e6, status);

    trailer_parse_result trailer;
    try {
        trailer = parse_trailer(output[2]);
    } catch (malformed_trailer_error &e) {
        if (timed_out)
            throw malformed_trailer_error(fmt::format("limitrace killed after {:.3f}s: {}", elapsed / 1e6, e.what()));
        throw;
    }

    execution_result result;
    result.exit_status = (int)trailer.detection.exit_status;
    result.statistics = trailer.statistics;
    result.detection = trailer.detection;
    result.stdout_text = move(output[1]);
    result.stderr_text = move(trailer.remaining);
    if (result.stderr_text.size() > cfg.max_output_size)
        result.stderr_text.resize(cfg.max_output_size);
    if (truncated[1]) LOG(INFO) << "stdout of " << argv[0] << " truncated";
    if (truncated[2]) LOG(INFO) << "stderr of " << argv[0] << " truncated";
    return result;
}

}  // namespace grader
