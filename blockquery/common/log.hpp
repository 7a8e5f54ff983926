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

#ifndef BLOCKQUERY_COMMON_LOG_HPP_
#define BLOCKQUERY_COMMON_LOG_HPP_

#include <mutex>
#include <ostream>
#include <string>

#include <absl/strings/string_view.h>

namespace blockquery {

// available verbosity levels
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, None };

// silence
std::ostream& null_stream();

//
// Below are for access via macros ONLY.
//
extern LogLevel log_verbosity_;
extern bool log_thread_enabled_;
void log_set_streams_(std::ostream& o1, std::ostream& o2);
class log_ {
  public:
    explicit log_(LogLevel level) : level_(level) { log_mtx_.lock(); }
    ~log_() { log_mtx_.unlock(); }

    template <class T>
    std::ostream& operator<<(const T& message) {
        return header_(level_) << message;
    }

  private:
    static std::ostream& header_(LogLevel level);

    LogLevel level_;
    static std::mutex log_mtx_;
};

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error);
std::string AbslUnparseFlag(LogLevel level);

} // namespace blockquery

#define BLOCKQUERY_LOG_AT(level_) if ((level_) < blockquery::log_verbosity_) {} else blockquery::log_(level_) << " " // NOLINT

// LogTrace, LogDebug, LogInfo, LogWarn, LogError, LogCritical, LogNone
#define BLOCKQUERY_TRACE BLOCKQUERY_LOG_AT(blockquery::LogLevel::Trace)
#define BLOCKQUERY_DEBUG BLOCKQUERY_LOG_AT(blockquery::LogLevel::Debug)
#define BLOCKQUERY_INFO  BLOCKQUERY_LOG_AT(blockquery::LogLevel::Info)
#define BLOCKQUERY_WARN  BLOCKQUERY_LOG_AT(blockquery::LogLevel::Warn)
#define BLOCKQUERY_ERROR BLOCKQUERY_LOG_AT(blockquery::LogLevel::Error)
#define BLOCKQUERY_CRIT  BLOCKQUERY_LOG_AT(blockquery::LogLevel::Critical)
#define BLOCKQUERY_LOG   BLOCKQUERY_LOG_AT(blockquery::LogLevel::None)

#define BLOCKQUERY_LOG_VERBOSITY(level_) (blockquery::log_verbosity_ = (level_))

#define BLOCKQUERY_LOG_THREAD(log_thread_) (blockquery::log_thread_enabled_ = (log_thread_))

#define BLOCKQUERY_LOG_STREAMS(stream1_, stream2_) blockquery::log_set_streams_((stream1_), (stream2_))

#endif  // BLOCKQUERY_COMMON_LOG_HPP_
