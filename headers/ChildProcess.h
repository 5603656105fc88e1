#pragma once
#include "LineStream.h"
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

// writes lines to a pipe or file descriptor it owns
class FdLineWriter : public LineWriter
{
public:
    explicit FdLineWriter(int fd);
    ~FdLineWriter() override;

    FdLineWriter(const FdLineWriter &) = delete;
    FdLineWriter &operator=(const FdLineWriter &) = delete;

    StreamStatus writeLine(const std::string &line) override;

private:
    int fd_;
};

// reads lines from a pipe or file descriptor it owns
class FdLineReader : public LineReader
{
public:
    explicit FdLineReader(int fd);
    ~FdLineReader() override;

    FdLineReader(const FdLineReader &) = delete;
    FdLineReader &operator=(const FdLineReader &) = delete;

    StreamStatus readLine(std::string &line) override;

private:
    int fd_;
    std::string buffer_; // bytes read past the last returned line
};

/**
 * external program with piped stdin and stdout
 * spawn before starting other threads, fork() only copies the calling thread
 */
class ChildProcess
{
public:
    // nullptr when the pipes or the fork fail, the reason is logged
    static std::unique_ptr<ChildProcess> spawn(const std::string &program, const std::vector<std::string> &args = {});

    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // hand out the ends of the pipes, each can be taken once
    std::unique_ptr<LineWriter> takeStdin();
    std::unique_ptr<LineReader> takeStdout();

    // blocks until the program exits, returns its exit status or -1
    int wait();

    pid_t getPid() const { return pid_; }

private:
    ChildProcess(pid_t pid, int stdinFd, int stdoutFd);

    pid_t pid_;
    int stdinFd_;
    int stdoutFd_;
    bool reaped_ = false;
};
