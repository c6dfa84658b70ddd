#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace trialsynth
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 *
 * Used to send pipeline progress to the console and a log file at once.
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Generate a timestamp string for file naming, e.g. "Oct_17_2026_1430"
 */
std::string getCurrentTimestamp();

/**
 * @brief Default log file name for a sub-command
 * @param command Sub-command name ("generate", "score", ...)
 * @return "trialsynth_<command>_<timestamp>.log"
 */
std::string createLogFileName(const std::string& command);

} // namespace utils
} // namespace trialsynth
