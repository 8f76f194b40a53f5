// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "logger.h"
#include "helpers.h"
#include "common.h"
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/back_inserter.hpp>

#if defined(__clang__)
#  pragma clang diagnostic push
#  pragma clang diagnostic ignored "-Wunknown-warning-option"
#  pragma clang diagnostic ignored "-Wtautological-constant-compare"
#endif

#include <boost/iostreams/filtering_stream.hpp>

#if defined(__clang__)
#  pragma clang diagnostic pop
#endif

#include <stdexcept>
#include <mutex>
#include <algorithm>

namespace wasmir {

using namespace std;

Logger* Logger::g_logger = 0;

namespace {

// One output stream with its own threshold
struct Sink {
    FILE* _file = nullptr;
    int _minLevel = LOG_SINK_DISABLED;
    bool _owned = false;

    bool accepts(int level) const {
        return _file && (_minLevel != LOG_SINK_DISABLED) && (level >= _minLevel);
    }

    void close() {
        if (_owned && _file) fclose(_file);
        _file = nullptr;
    }
};

} //namespace

class LoggerImpl : public Logger {
    mutex _mutex;
    static const size_t MAX_HEADER_SIZE = 256;
    static const size_t MAX_TIMESTAMP_SIZE = 80;

    Sink _console;
    Sink _fileSink;
    int _flushLevel;
    LogMessageHeaderFormatter _headerFormatter = def_header_formatter;
    std::string _timeFormat;
    bool _printMilliseconds;
    std::string _fullPath;

public:
    LoggerImpl(int flushLevel, int consoleLevel, int fileLevel, const string& fileNamePrefix, const string& dstPath) :
        _flushLevel(flushLevel),
        _timeFormat("%Y-%m-%d.%T"),
        _printMilliseconds(true)
    {
        if (consoleLevel < 0 || fileLevel < 0) throw runtime_error("logger: minimal level out of range");
        if (consoleLevel == LOG_SINK_DISABLED && fileLevel == LOG_SINK_DISABLED) throw runtime_error("no logger sink configured");

        if (consoleLevel != LOG_SINK_DISABLED) {
            _console._file = stdout;
            _console._minLevel = consoleLevel;
        }

        if (fileLevel != LOG_SINK_DISABLED) {
            open_file(fileNamePrefix, dstPath);
            _fileSink._minLevel = fileLevel;
        }
    }

    ~LoggerImpl() override {
        _fileSink.close();
        if (this == g_logger) {
            g_logger = 0;
        }
    }

    void set_header_formatter(LogMessageHeaderFormatter formatter) override {
        if (formatter) _headerFormatter = formatter;
    }

    void set_time_format(const char* format, bool printMilliseconds) override {
        if (format) {
            _timeFormat = format;
            _printMilliseconds = printMilliseconds;
        } else {
            _timeFormat.clear();
            _printMilliseconds = false;
        }
    }

    const std::string& get_current_file_name() override {
        return _fullPath;
    }

    bool level_accepted(int level) override {
        return _console.accepts(level) || _fileSink.accepts(level);
    }

    void write_message(const LogMessageHeader& header, const char* buf, size_t size) override {
        char timestampFormatted[MAX_TIMESTAMP_SIZE];
        char headerFormatted[MAX_HEADER_SIZE];
        if (!_timeFormat.empty()) {
            format_timestamp(timestampFormatted, MAX_TIMESTAMP_SIZE, _timeFormat.c_str(), header.timestamp, _printMilliseconds);
        } else {
            timestampFormatted[0] = 0;
        }
        size_t headerSize = _headerFormatter(headerFormatted, MAX_HEADER_SIZE, timestampFormatted, header);
        std::setmin(headerSize, MAX_HEADER_SIZE - 1);

        lock_guard<mutex> lock(_mutex);
        write_to(_console, header.level, headerFormatted, headerSize, buf, size);
        write_to(_fileSink, header.level, headerFormatted, headerSize, buf, size);
    }

private:
    void write_to(Sink& sink, int level, const char* header, size_t headerSize, const char* msg, size_t size) {
        if (!sink.accepts(level)) return;
        fwrite(header, 1, headerSize, sink._file);
        fwrite(msg, 1, size, sink._file);
        if (level >= _flushLevel) fflush(sink._file);
    }

    void open_file(const string& fileNamePrefix, const string& dstPath) {
        string fileName(fileNamePrefix);
        fileName += format_timestamp("%y_%m_%d_%H_%M_%S", local_timestamp_msec(), false);
        fileName += ".log";

        boost::filesystem::path path(fileName);
        if (!dstPath.empty()) {
            boost::filesystem::path dir(dstPath);
            if (!boost::filesystem::exists(dir)) {
                boost::filesystem::create_directories(dir);
            }
            path = dir / path;
        }

        _fullPath = path.string();
        _fileSink._file = fopen(_fullPath.c_str(), "ab");
        if (!_fileSink._file) throw runtime_error(string("cannot open file ") + _fullPath);
        _fileSink._owned = true;
    }
};

std::shared_ptr<Logger> Logger::create(
    int flushLevel,
    int consoleLevel,
    int fileLevel,
    const std::string& fileNamePrefix,
    const std::string& dstPath
) {
    if (g_logger) {
        throw runtime_error("logger already initialized");
    }

    std::shared_ptr<Logger> logger = std::make_shared<LoggerImpl>(flushLevel, consoleLevel, fileLevel, fileNamePrefix, dstPath);
    g_logger = logger.get();
    return logger;
}

namespace {

static constexpr size_t MAX_MSG_SIZE = 10000;

struct LogThreadContext {
    using Formatter = boost::iostreams::filtering_ostream;

    std::string msgBuffer;
    std::unique_ptr<Formatter> formatter;

    LogThreadContext() :
        formatter(std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer)))
    {}

    void reset() {
        msgBuffer = std::string();
        formatter = std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer));
    }
};

LogThreadContext* get_context() {
    static thread_local LogThreadContext ctx;
    return &ctx;
}

} //namespace

LogMessageHeader::LogMessageHeader(int _level, const char* _file, int _line, const char* _func) :
    timestamp(local_timestamp_msec()),
    func(_func),
    file(_file),
    line(_line),
    level(_level)
{
    if (!func) func = "";
    if (!file) {
        file = "";
    } else {
#ifdef PROJECT_SOURCE_DIR
        static const size_t offset = strlen(PROJECT_SOURCE_DIR)+1;
        if (strlen(file) > offset) file += offset;
#endif
    }
}

LogMessage::LogMessage(int _level, const char* _file, int _line, const char* _func) :
    header(_level, _file, _line, _func)
{
    LogThreadContext* ctx = get_context();
    if (ctx->msgBuffer.capacity() < MAX_MSG_SIZE) {
        ctx->msgBuffer.reserve(MAX_MSG_SIZE);
    }
    _formatter = ctx->formatter.get();
}

LogMessage::~LogMessage() {
    if (Logger::g_logger && _formatter) {
        *_formatter << '\n';
        _formatter->flush();
        std::string& buffer = get_context()->msgBuffer;
        Logger::g_logger->write_message(header, buffer.data(), buffer.size());
        if (buffer.size() > MAX_MSG_SIZE) {
            get_context()->reset();
        }
        else {
            buffer.clear();
        }
    }
}

} //namespace
