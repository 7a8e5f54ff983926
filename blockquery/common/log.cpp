/*
   Copyright 2023 The Silkrpc Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "log.hpp"

#include <iostream>
#include <streambuf>
#include <string>
#include <thread>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace blockquery {

namespace {

// Unbuffered stream buffer writing every character to two target buffers.
class TeeBuffer : public std::streambuf {
  public:
    TeeBuffer(std::streambuf* sb1, std::streambuf* sb2) : sb1_(sb1), sb2_(sb2) {}

    void set_buffers(std::streambuf* sb1, std::streambuf* sb2) {
        sb1_ = sb1;
        sb2_ = sb2;
    }

  private:
    int overflow(int c) override {
        if (c == EOF) {
            return !EOF;
        }
        const int r1 = sb1_->sputc(static_cast<char>(c));
        const int r2 = sb2_->sputc(static_cast<char>(c));
        return (r1 == EOF || r2 == EOF) ? EOF : c;
    }

    int sync() override {
        const int r1 = sb1_->pubsync();
        const int r2 = sb2_->pubsync();
        return (r1 == 0 && r2 == 0) ? 0 : -1;
    }

    std::streambuf* sb1_;
    std::streambuf* sb2_;
};

class TeeStream : public std::ostream {
  public:
    TeeStream(std::ostream& o1, std::ostream& o2) : std::ostream(&buffer_), buffer_(o1.rdbuf(), o2.rdbuf()) {}

    void set_streams(std::streambuf* sb1, std::streambuf* sb2) { buffer_.set_buffers(sb1, sb2); }

  private:
    TeeBuffer buffer_;
};

constexpr char const kLogTags_[7][6] = {
    "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "CRIT ", "NONE ",
};

TeeStream& log_streams() {
    static TeeStream streams{std::cerr, null_stream()};
    return streams;
}

} // namespace

LogLevel log_verbosity_{LogLevel::Info};
bool log_thread_enabled_{false};

// Log to one or two output streams, typically the console and an optional log file.
void log_set_streams_(std::ostream& o1, std::ostream& o2) { log_streams().set_streams(o1.rdbuf(), o2.rdbuf()); }

std::mutex log_::log_mtx_;

std::ostream& log_::header_(LogLevel level) {
    auto& streams = log_streams();
    streams << kLogTags_[static_cast<int>(level)] << "["
            << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), absl::LocalTimeZone()) << "]";
    if (log_thread_enabled_) {
        streams << " " << std::this_thread::get_id();
    }
    return streams;
}

std::ostream& null_stream() {
    static struct null_buf : public std::streambuf {
        int overflow(int c) override { return c; }
    } null_buf;
    static struct null_strm : public std::ostream {
        null_strm() : std::ostream(&null_buf) {}
    } null_strm;
    return null_strm;
}

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error) {
    if (text == "n") {
        *level = LogLevel::None;
        return true;
    }
    if (text == "c") {
        *level = LogLevel::Critical;
        return true;
    }
    if (text == "e") {
        *level = LogLevel::Error;
        return true;
    }
    if (text == "w") {
        *level = LogLevel::Warn;
        return true;
    }
    if (text == "i") {
        *level = LogLevel::Info;
        return true;
    }
    if (text == "d") {
        *level = LogLevel::Debug;
        return true;
    }
    if (text == "t") {
        *level = LogLevel::Trace;
        return true;
    }
    *error = "unknown value for LogLevel";
    return false;
}

std::string AbslUnparseFlag(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "n";
        case LogLevel::Critical: return "c";
        case LogLevel::Error: return "e";
        case LogLevel::Warn: return "w";
        case LogLevel::Info: return "i";
        case LogLevel::Debug: return "d";
        case LogLevel::Trace: return "t";
        default: return absl::StrCat(static_cast<int>(level));
    }
}

} // namespace blockquery
