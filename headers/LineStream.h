#pragma once
#include <string>

enum class StreamStatus
{
    Ok,
    Closed, // end of stream / peer went away
    Failed
};

// sink for newline terminated messages
class LineWriter
{
public:
    virtual ~LineWriter() = default;

    // writes line plus a newline and flushes
    virtual StreamStatus writeLine(const std::string &line) = 0;
};

// source of newline terminated messages
class LineReader
{
public:
    virtual ~LineReader() = default;

    // blocks for one full line, the newline is stripped
    virtual StreamStatus readLine(std::string &line) = 0;
};
