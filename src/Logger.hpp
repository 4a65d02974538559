#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <string>
#include <fstream>
#include <mutex>
using namespace std;
class Logger {
public:
    enum Level {
        LEVEL_DEBUG = 0,
        LEVEL_INFO,
        LEVEL_WARNING,
        LEVEL_ERROR
    };

    static Logger & getInstance();

    // log info level message
    void info(const std::string & message);

    // log warning level message
    void warning(const std::string & message);

    // log debug level message
    void debug(const std::string & message);

    // log error level message
    void error(const std::string & message);

    // log info level message for request id
    void info(int id, const std::string & message);

    // log warning level message for request id
    void warning(int id, const std::string & message);

    // log debug level message for request id
    void debug(int id, const std::string & message);

    // log error level message for request id
    void error(int id, const std::string & message);

    // get current time
    std::string getCurrentTime();

    // open INFO/WARNING/DEBUG/ERROR.log under dir, keeps console output if it fails
    void setLogPath(const std::string & dir);

    // minimum level printed to the console
    void setLevel(Level level);

    ~Logger();

private:
    std::ofstream logFileInfo;
    std::ofstream logFileWarning;
    std::ofstream logFileDebug;
    std::ofstream logFileError;
    std::mutex mtx;
    bool isInitialized;
    Level consoleLevel;

    Logger() : isInitialized(false), consoleLevel(LEVEL_DEBUG) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // write one line to console and to every file at or below level
    void log(Level level, const std::string & line);

    std::string format(Level level, const std::string & message);
    std::string format(Level level, int id, const std::string & message);

    static const char * levelName(Level level);
};

#endif
