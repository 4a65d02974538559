#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <ctime>
#include <stdexcept>
using namespace std;
// singleton get instance
Logger & Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogPath(const std::string & dir) {
    std::lock_guard<std::mutex> lock(mtx);
    if (isInitialized) {
        if (logFileInfo.is_open()) logFileInfo.close();
        if (logFileWarning.is_open()) logFileWarning.close();
        if (logFileDebug.is_open()) logFileDebug.close();
        if (logFileError.is_open()) logFileError.close();
        isInitialized = false;
    }

    try {
        std::filesystem::path log_dir(dir);
        if (!log_dir.empty()) {
            std::filesystem::create_directories(log_dir);
        }

        logFileInfo.open((log_dir / "INFO.log").string(), std::ios::app);
        if (!logFileInfo.is_open()) {
            throw std::runtime_error("Failed to open INFO.log under " + dir);
        }

        logFileWarning.open((log_dir / "WARNING.log").string(), std::ios::app);
        if (!logFileWarning.is_open()) {
            throw std::runtime_error("Failed to open WARNING.log under " + dir);
        }

        logFileDebug.open((log_dir / "DEBUG.log").string(), std::ios::app);
        if (!logFileDebug.is_open()) {
            throw std::runtime_error("Failed to open DEBUG.log under " + dir);
        }

        logFileError.open((log_dir / "ERROR.log").string(), std::ios::app);
        if (!logFileError.is_open()) {
            throw std::runtime_error("Failed to open ERROR.log under " + dir);
        }
        isInitialized = true;
    }
    catch (const std::exception& e) {
        std::cerr << "Logger initialization error: " << e.what() << std::endl;
        // Continue without file logging, but with console output
        isInitialized = false;
    }
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(mtx);
    consoleLevel = level;
}

// destructor
Logger::~Logger() {
    if (logFileInfo.is_open()) logFileInfo.close();
    if (logFileWarning.is_open()) logFileWarning.close();
    if (logFileDebug.is_open()) logFileDebug.close();
    if (logFileError.is_open()) logFileError.close();
}

const char * Logger::levelName(Level level) {
    switch (level) {
        case LEVEL_DEBUG: return "DEBUG";
        case LEVEL_INFO: return "INFO";
        case LEVEL_WARNING: return "WARNING";
        case LEVEL_ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Logger::format(Level level, const std::string & message) {
    return getCurrentTime() + " [" + levelName(level) + "] " + message;
}

std::string Logger::format(Level level, int id, const std::string & message) {
    return getCurrentTime() + " [" + levelName(level) + "] " + to_string(id) + ": " + message;
}

// a line at some level also lands in the file of every more verbose level
void Logger::log(Level level, const std::string & line) {
    std::lock_guard<std::mutex> lock(mtx);
    if (level >= consoleLevel) {
        std::cout << line << std::endl;
    }
    if (!isInitialized) {
        return;
    }
    std::ofstream * files[] = {&logFileDebug, &logFileInfo, &logFileWarning, &logFileError};
    for (int i = LEVEL_DEBUG; i <= level; i++) {
        *files[i] << line << std::endl;
        files[i]->flush();
    }
}

void Logger::info(const std::string & message) {
    log(LEVEL_INFO, format(LEVEL_INFO, message));
}

void Logger::warning(const std::string & message) {
    log(LEVEL_WARNING, format(LEVEL_WARNING, message));
}

void Logger::debug(const std::string & message) {
    log(LEVEL_DEBUG, format(LEVEL_DEBUG, message));
}

void Logger::error(const std::string & message) {
    log(LEVEL_ERROR, format(LEVEL_ERROR, message));
}

void Logger::info(int id, const std::string & message) {
    log(LEVEL_INFO, format(LEVEL_INFO, id, message));
}

void Logger::warning(int id, const std::string & message) {
    log(LEVEL_WARNING, format(LEVEL_WARNING, id, message));
}

void Logger::debug(int id, const std::string & message) {
    log(LEVEL_DEBUG, format(LEVEL_DEBUG, id, message));
}

void Logger::error(int id, const std::string & message) {
    log(LEVEL_ERROR, format(LEVEL_ERROR, id, message));
}

std::string Logger::getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm;
    localtime_r(&in_time_t, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
