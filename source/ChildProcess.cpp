#include "ChildProcess.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>

FdLineWriter::FdLineWriter(int fd)
    : fd_(fd)
{
}

FdLineWriter::~FdLineWriter()
{
    if (fd_ >= 0)
        ::close(fd_);
}

StreamStatus FdLineWriter::writeLine(const std::string &line)
{
    std::string data = line;
    data.push_back('\n');

    size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return errno == EPIPE ? StreamStatus::Closed : StreamStatus::Failed;
        }
        written += static_cast<size_t>(n);
    }

    return StreamStatus::Ok;
}

FdLineReader::FdLineReader(int fd)
    : fd_(fd)
{
}

FdLineReader::~FdLineReader()
{
    if (fd_ >= 0)
        ::close(fd_);
}

StreamStatus FdLineReader::readLine(std::string &line)
{
    char chunk[4096];

    while (true)
    {
        size_t newlinePos = buffer_.find('\n');
        if (newlinePos != std::string::npos)
        {
            line = buffer_.substr(0, newlinePos);
            buffer_.erase(0, newlinePos + 1);
            return StreamStatus::Ok;
        }

        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return StreamStatus::Failed;
        }
        if (n == 0)
            return StreamStatus::Closed; // a trailing partial line is dropped

        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::string &program, const std::vector<std::string> &args)
{
    int toChild[2];
    int fromChild[2];

    if (::pipe2(toChild, O_CLOEXEC) != 0)
    {
        std::cerr << "Error: Could not create pipe for " << program << ": " << std::strerror(errno) << std::endl;
        return nullptr;
    }
    if (::pipe2(fromChild, O_CLOEXEC) != 0)
    {
        std::cerr << "Error: Could not create pipe for " << program << ": " << std::strerror(errno) << std::endl;
        ::close(toChild[0]);
        ::close(toChild[1]);
        return nullptr;
    }

    // argv has to be built before forking
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(program.c_str()));
    for (const auto &arg : args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
    {
        std::cerr << "Error: Could not fork for " << program << ": " << std::strerror(errno) << std::endl;
        ::close(toChild[0]);
        ::close(toChild[1]);
        ::close(fromChild[0]);
        ::close(fromChild[1]);
        return nullptr;
    }

    if (pid == 0)
    {
        // child: dup2 clears close-on-exec on the duplicated descriptors
        ::dup2(toChild[0], STDIN_FILENO);
        ::dup2(fromChild[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(toChild[0]);
    ::close(fromChild[1]);

    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, toChild[1], fromChild[0]));
}

ChildProcess::ChildProcess(pid_t pid, int stdinFd, int stdoutFd)
    : pid_(pid), stdinFd_(stdinFd), stdoutFd_(stdoutFd)
{
}

ChildProcess::~ChildProcess()
{
    if (stdinFd_ >= 0)
        ::close(stdinFd_);
    if (stdoutFd_ >= 0)
        ::close(stdoutFd_);

    // reap if already gone, never block here
    if (!reaped_)
        ::waitpid(pid_, nullptr, WNOHANG);
}

std::unique_ptr<LineWriter> ChildProcess::takeStdin()
{
    if (stdinFd_ < 0)
        return nullptr;

    int fd = stdinFd_;
    stdinFd_ = -1;
    return std::make_unique<FdLineWriter>(fd);
}

std::unique_ptr<LineReader> ChildProcess::takeStdout()
{
    if (stdoutFd_ < 0)
        return nullptr;

    int fd = stdoutFd_;
    stdoutFd_ = -1;
    return std::make_unique<FdLineReader>(fd);
}

int ChildProcess::wait()
{
    if (reaped_)
        return -1;

    int status = 0;
    pid_t result;
    do
    {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0)
        return -1;

    reaped_ = true;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}
