#include "process/Subprocess.hpp"

#include "utils/Log.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#error "rcs::process is implemented for POSIX hosts only"
#endif

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace rcs::process
{

namespace
{

class UniqueFd
{
  public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    UniqueFd(UniqueFd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd &operator=(UniqueFd &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }
    UniqueFd(UniqueFd const &) = delete;
    UniqueFd &operator=(UniqueFd const &) = delete;
    ~UniqueFd() { reset(); }

    int get() const noexcept { return fd_; }
    int release() noexcept { return std::exchange(fd_, -1); }
    void reset() noexcept
    {
        if (fd_ != -1)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

  private:
    int fd_ = -1;
};

struct Pipe
{
    UniqueFd read;
    UniqueFd write;
};

Pipe make_pipe()
{
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0)
    {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    Pipe result{UniqueFd(fds[0]), UniqueFd(fds[1])};
    // Neither end may leak into the child; the write end reaches it through
    // dup2, which clears the flag on the duplicate.
    for (int fd : fds)
    {
        if (::fcntl(fd, F_SETFD, FD_CLOEXEC) != 0)
        {
            throw std::system_error(errno, std::generic_category(), "fcntl");
        }
    }
    return result;
}

struct FileActions
{
    FileActions()
    {
        if (int rc = posix_spawn_file_actions_init(&actions); rc != 0)
        {
            throw std::system_error(rc, std::generic_category(),
                                    "posix_spawn_file_actions_init");
        }
    }
    ~FileActions() { posix_spawn_file_actions_destroy(&actions); }
    FileActions(FileActions const &) = delete;
    FileActions &operator=(FileActions const &) = delete;

    posix_spawn_file_actions_t actions;
};

struct SpawnAttributes
{
    SpawnAttributes()
    {
        if (int rc = posix_spawnattr_init(&attr); rc != 0)
        {
            throw std::system_error(rc, std::generic_category(),
                                    "posix_spawnattr_init");
        }
    }
    ~SpawnAttributes() { posix_spawnattr_destroy(&attr); }
    SpawnAttributes(SpawnAttributes const &) = delete;
    SpawnAttributes &operator=(SpawnAttributes const &) = delete;

    posix_spawnattr_t attr;
};

void check_spawn_call(int rc, char const *what)
{
    if (rc != 0)
    {
        throw std::system_error(rc, std::generic_category(), what);
    }
}

struct SpawnedChild
{
    pid_t pid = -1;
    UniqueFd stdout_fd;
    UniqueFd stderr_fd;
};

SpawnedChild spawn_child(CommandLine const &command,
                         std::optional<EnvironmentMap> const &environment)
{
    auto out = make_pipe();
    auto err = make_pipe();

    FileActions actions;
    check_spawn_call(posix_spawn_file_actions_addopen(
                         &actions.actions, STDIN_FILENO, "/dev/null",
                         O_RDONLY, 0),
                     "posix_spawn_file_actions_addopen");
    check_spawn_call(posix_spawn_file_actions_adddup2(
                         &actions.actions, out.write.get(), STDOUT_FILENO),
                     "posix_spawn_file_actions_adddup2");
    check_spawn_call(posix_spawn_file_actions_adddup2(
                         &actions.actions, err.write.get(), STDERR_FILENO),
                     "posix_spawn_file_actions_adddup2");

    // Own process group so a forced kill also reaches helpers the child
    // forks. Signal state is reset because reader threads may block signals.
    SpawnAttributes attributes;
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    check_spawn_call(posix_spawnattr_setflags(
                         &attributes.attr,
                         POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK |
                             POSIX_SPAWN_SETSIGDEF),
                     "posix_spawnattr_setflags");
    check_spawn_call(posix_spawnattr_setpgroup(&attributes.attr, 0),
                     "posix_spawnattr_setpgroup");
    check_spawn_call(posix_spawnattr_setsigmask(&attributes.attr, &empty_mask),
                     "posix_spawnattr_setsigmask");
    check_spawn_call(
        posix_spawnattr_setsigdefault(&attributes.attr, &default_signals),
        "posix_spawnattr_setsigdefault");

    std::vector<char *> argv;
    argv.reserve(command.args.size() + 2);
    argv.push_back(const_cast<char *>(command.program.c_str()));
    for (auto const &arg : command.args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_entries;
    std::vector<char *> envp;
    char **env_block = environ;
    if (environment)
    {
        env_entries = to_envp_entries(*environment);
        envp.reserve(env_entries.size() + 1);
        for (auto &entry : env_entries)
        {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);
        env_block = envp.data();
    }

    // posix_spawnp searches the caller's PATH, not the child's environment.
    SpawnedChild child;
    int rc = posix_spawnp(&child.pid, command.program.c_str(), &actions.actions,
                          &attributes.attr, argv.data(), env_block);
    if (rc != 0)
    {
        throw std::system_error(rc, std::generic_category(),
                                "failed to start " + command.program);
    }
    child.stdout_fd = std::move(out.read);
    child.stderr_fd = std::move(err.read);
    return child;
}

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int wait_for_pid(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            return -1;
        }
    }
    return decode_wait_status(status);
}

} // namespace

char const *to_string(OutputStream stream) noexcept
{
    return stream == OutputStream::Stdout ? "stdout" : "stderr";
}

SyncResult run_sync(CommandLine const &command,
                    std::optional<EnvironmentMap> const &environment)
{
    auto child = spawn_child(command, environment);

    SyncResult result;
    std::array<pollfd, 2> fds{};
    fds[0] = {child.stdout_fd.get(), POLLIN, 0};
    fds[1] = {child.stderr_fd.get(), POLLIN, 0};
    std::array<std::string *, 2> sinks = {&result.stdout_text,
                                          &result.stderr_text};
    int open_streams = 2;
    char buffer[4096];
    while (open_streams > 0)
    {
        if (::poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }
        for (std::size_t i = 0; i < fds.size(); ++i)
        {
            if (fds[i].fd < 0 || fds[i].revents == 0)
            {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0)
            {
                sinks[i]->append(buffer, static_cast<std::size_t>(n));
            }
            else if (n == 0 || errno != EINTR)
            {
                // Negative descriptors are skipped by poll().
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }
    child.stdout_fd.reset();
    child.stderr_fd.reset();
    result.exit_code = wait_for_pid(child.pid);
    return result;
}

ChildProcess::~ChildProcess()
{
    if (is_running())
    {
        kill();
    }
    wait();
}

void ChildProcess::start(CommandLine const &command,
                         std::optional<EnvironmentMap> const &environment,
                         Callbacks callbacks)
{
    if (reaper_.joinable())
    {
        throw std::logic_error("ChildProcess already started");
    }
    auto child = spawn_child(command, environment);
    callbacks_ = std::move(callbacks);
    pid_ = child.pid;
    running_.store(true, std::memory_order_release);

    stdout_reader_ = std::thread(&ChildProcess::read_stream, this,
                                 child.stdout_fd.release(),
                                 OutputStream::Stdout);
    stderr_reader_ = std::thread(&ChildProcess::read_stream, this,
                                 child.stderr_fd.release(),
                                 OutputStream::Stderr);
    reaper_ = std::thread(&ChildProcess::reap, this);
}

bool ChildProcess::is_running() const noexcept
{
    return running_.load(std::memory_order_acquire);
}

std::optional<int> ChildProcess::exit_code() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_code_;
}

bool ChildProcess::kill() noexcept
{
    return send_signal(SIGKILL);
}

bool ChildProcess::terminate() noexcept
{
    return send_signal(SIGTERM);
}

bool ChildProcess::send_signal(int signal) noexcept
{
    // exited_ flips before the pid is reaped, so the pid cannot have been
    // recycled while the lock is held and exited_ is false.
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid_ <= 0 || exited_)
    {
        return false;
    }
    if (::kill(-pid_, signal) == 0)
    {
        return true;
    }
    return ::kill(pid_, signal) == 0;
}

void ChildProcess::wait()
{
    if (reaper_.joinable())
    {
        reaper_.join();
    }
}

void ChildProcess::read_stream(int fd, OutputStream stream)
{
    UniqueFd guard(fd);
    char buffer[4096];
    while (true)
    {
        ssize_t n = ::read(guard.get(), buffer, sizeof(buffer));
        if (n > 0)
        {
            if (callbacks_.on_output)
            {
                callbacks_.on_output(
                    stream, std::string_view(buffer, static_cast<std::size_t>(n)));
            }
            continue;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0)
        {
            RCS_LOG_WARN("read from child {} {} failed: {}", pid_,
                         to_string(stream),
                         std::generic_category().message(errno));
        }
        break;
    }
    if (callbacks_.on_stream_closed)
    {
        callbacks_.on_stream_closed(stream);
    }
}

void ChildProcess::reap()
{
    // Wait without reaping so send_signal() never targets a recycled pid.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info,
                    WEXITED | WNOWAIT) != 0 &&
           errno == EINTR)
    {
    }
    int code = -1;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        exited_ = true;
        code = wait_for_pid(pid_);
        exit_code_ = code;
    }
    running_.store(false, std::memory_order_release);

    if (stdout_reader_.joinable())
    {
        stdout_reader_.join();
    }
    if (stderr_reader_.joinable())
    {
        stderr_reader_.join();
    }
    if (callbacks_.on_exit)
    {
        callbacks_.on_exit(code);
    }
}

} // namespace rcs::process
