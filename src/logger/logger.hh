#pragma once

#include "fast.upload.types.h"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

class Logger
{
  public:
    static void set_log_level(UploadLogLevel level);
    static UploadLogLevel get_log_level();

    template<typename... Args>
    static std::string log(UploadLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        namespace fs = std::filesystem;

        if (current_level_ == UploadLogLevel_None || level < current_level_) {
            return {}; // Suppress logs
        }

        std::scoped_lock lock(log_mutex_);

        std::string prefix;
        auto stream = &std::cout;

        switch (level) {
            case UploadLogLevel_Debug:
                prefix = "[DEBUG] ";
                break;
            case UploadLogLevel_Info:
                prefix = "[INFO] ";
                break;
            case UploadLogLevel_Warning:
                prefix = "[WARNING] ";
                break;
            default:
                prefix = "[ERROR] ";
                stream = &std::cerr;
                break;
        }

        fs::path filepath(file);
        std::string filename = filepath.filename().string();

        std::ostringstream ss;
        ss << get_timestamp_() << " " << prefix << filename << ":" << line
           << " " << func << ": ";

        format_arg_(ss, std::forward<Args>(args)...);

        std::string message = ss.str();
        *stream << message << std::endl;

        return message;
    }

  private:
    static UploadLogLevel current_level_;
    static std::mutex log_mutex_;

    static void format_arg_(std::ostream& ss) {} // base case
    template<typename T, typename... Args>
    static void format_arg_(std::ostream& ss, T&& arg, Args&&... args)
    {
        ss << std::forward<T>(arg);
        format_arg_(ss, std::forward<Args>(args)...);
    }

    static std::string get_timestamp_();
};
