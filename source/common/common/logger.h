#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "unseal/common/pure.h"

#include "source/common/common/base_logger.h"
#include "source/common/common/fmt.h"
#include "source/common/common/macros.h"
#include "source/common/common/non_copyable.h"

#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "spdlog/spdlog.h"
#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/sink.h"

namespace Unseal {
namespace Logger {

#define ALL_LOGGER_IDS(FUNCTION)                                                                   \
  FUNCTION(assert)                                                                                 \
  FUNCTION(config)                                                                                 \
  FUNCTION(filesystem)                                                                             \
  FUNCTION(main)                                                                                   \
  FUNCTION(materializer)                                                                           \
  FUNCTION(misc)                                                                                   \
  FUNCTION(secret)                                                                                 \
  FUNCTION(testing)

// clang-format off
enum class Id {
  ALL_LOGGER_IDS(GENERATE_ENUM)
};
// clang-format on

/**
 * Logger that uses the DelegatingLogSink.
 */
class StandardLogger : public Logger {
private:
  StandardLogger(const std::string& name);

  friend class Registry;
};

class DelegatingLogSink;
using DelegatingLogSinkSharedPtr = std::shared_ptr<DelegatingLogSink>;

/**
 * Captures a logging sink that can be delegated to for a bounded amount of time.
 * On destruction, logging is reverted to its previous state. SinkDelegates must
 * be allocated/freed as a stack.
 */
class SinkDelegate : NonCopyable {
public:
  explicit SinkDelegate(DelegatingLogSinkSharedPtr log_sink);
  virtual ~SinkDelegate();

  /**
   * Called to log a single log line.
   * @param formatted_msg The final, formatted message.
   * @param the original log message, including additional metadata.
   */
  virtual void log(absl::string_view msg, const spdlog::details::log_msg& log_msg) PURE;

  /**
   * Called to flush the log sink.
   */
  virtual void flush() PURE;

protected:
  // Swap the current log sink delegate for this one. This should be called by the derived class
  // constructor immediately before returning. This is required to match restoreDelegate(),
  // otherwise it's possible for the previous delegate to get set in the base class constructor,
  // the derived class constructor throws, and cleanup becomes broken.
  void setDelegate();

  // Swap the current log sink (this) for the previous one. This should be called by the derived
  // class destructor in the body. This is critical as otherwise it's possible for a log message
  // to get routed to a partially destructed sink.
  void restoreDelegate();

  SinkDelegate* previousDelegate() { return previous_delegate_; }

private:
  SinkDelegate* previous_delegate_{nullptr};
  DelegatingLogSinkSharedPtr log_sink_;
};

/**
 * SinkDelegate that writes log messages to stderr.
 */
class StderrSinkDelegate : public SinkDelegate {
public:
  explicit StderrSinkDelegate(DelegatingLogSinkSharedPtr log_sink);
  ~StderrSinkDelegate() override;

  // SinkDelegate
  void log(absl::string_view msg, const spdlog::details::log_msg& log_msg) override;
  void flush() override;
};

/**
 * Stacks logging sinks, so you can temporarily override the logging mechanism, restoring
 * the previous state when the DelegatingSink is destructed.
 */
class DelegatingLogSink : public spdlog::sinks::sink {
public:
  // spdlog::sinks::sink
  void log(const spdlog::details::log_msg& msg) override;
  void flush() override;
  void set_pattern(const std::string& pattern) override {
    set_formatter(std::make_unique<spdlog::pattern_formatter>(pattern));
  }
  void set_formatter(std::unique_ptr<spdlog::formatter> formatter) override;

  /**
   * Constructs a new DelegatingLogSink, sets up the default sink to stderr,
   * and returns a shared_ptr to it.
   *
   * A shared_ptr is required for sinks used in spdlog::logger. This method
   * must own the construction process because StderrSinkDelegate needs access to
   * the DelegatingLogSinkSharedPtr, not just the DelegatingLogSink*, and that is only
   * available after construction.
   */
  static DelegatingLogSinkSharedPtr init();

private:
  friend class SinkDelegate;

  DelegatingLogSink() = default;

  void setDelegate(SinkDelegate* sink) {
    absl::WriterMutexLock lock(&sink_mutex_);
    sink_ = sink;
  }
  SinkDelegate* delegate() {
    absl::ReaderMutexLock lock(&sink_mutex_);
    return sink_;
  }

  SinkDelegate* sink_ ABSL_GUARDED_BY(sink_mutex_){nullptr};
  absl::Mutex sink_mutex_;
  std::unique_ptr<StderrSinkDelegate> stderr_sink_; // Builtin sink to use as a last resort.
  std::unique_ptr<spdlog::formatter> formatter_ ABSL_GUARDED_BY(format_mutex_);
  absl::Mutex format_mutex_;
};

/**
 * Defines a scope for the logging system with the specified log level and format.
 * This is equivalent to Registry::setLogLevel and Registry::setLogFormat.
 *
 * Contexts can be nested. When a nested context is destroyed, the previous
 * context is restored. When all contexts are destroyed, the registry keeps the
 * settings of the outermost context.
 */
class Context {
public:
  Context(spdlog::level::level_enum log_level, const std::string& log_format);
  ~Context();

private:
  void activate();

  const spdlog::level::level_enum log_level_;
  const std::string log_format_;
  Context* const save_context_;
};

/**
 * A registry of all named loggers in unseal. Usable for adjusting levels of each logger
 * individually.
 */
class Registry {
public:
  /**
   * @param id supplies the fixed ID of the logger to create.
   * @return spdlog::logger& a logger with system specified sinks for a given ID.
   */
  static spdlog::logger& getLog(Id id);

  /**
   * @return the singleton sink to use for all loggers.
   */
  static DelegatingLogSinkSharedPtr getSink() {
    static DelegatingLogSinkSharedPtr sink = DelegatingLogSink::init();
    return sink;
  }

  /**
   * Sets the minimum log severity required to print messages.
   * Messages below this loglevel will be suppressed.
   */
  static void setLogLevel(spdlog::level::level_enum log_level);

  /**
   * Sets the log format.
   */
  static void setLogFormat(const std::string& log_format);

  /**
   * @return std::vector<Logger>& the installed loggers.
   */
  static std::vector<Logger>& loggers() { return allLoggers(); }

private:
  /*
   * @return std::vector<Logger>& return the installed loggers.
   */
  static std::vector<Logger>& allLoggers();
};

/**
 * Mixin class that allows any class to perform logging with a logger of a particular ID.
 */
template <Id id> class Loggable {
protected:
  /**
   * Do not use this directly, use macros defined below.
   * @return spdlog::logger& the static log instance to use for class local logging.
   */
  static spdlog::logger& __log_do_not_use_read_comment() { // NOLINT(readability-identifier-naming)
    static spdlog::logger& instance = Registry::getLog(id);
    return instance;
  }
};

} // namespace Logger

/**
 * Base logging macros. It is expected that users will use the convenience macros below rather than
 * invoke these directly.
 */

#define UNSEAL_SPDLOG_LEVEL(LEVEL)                                                                 \
  (static_cast<spdlog::level::level_enum>(Unseal::Logger::Logger::LEVEL))

#define UNSEAL_LOG_COMP_LEVEL(LOGGER, LEVEL) (UNSEAL_SPDLOG_LEVEL(LEVEL) >= (LOGGER).level())

// Compare levels before invoking logger. This is an optimization to avoid
// executing expressions computing log contents when they would be suppressed.
// The same filtering will also occur in spdlog::logger.
#define UNSEAL_LOG_COMP_AND_LOG(LOGGER, LEVEL, ...)                                                \
  do {                                                                                             \
    if (UNSEAL_LOG_COMP_LEVEL(LOGGER, LEVEL)) {                                                    \
      LOGGER.log(::spdlog::source_loc{__FILE__, __LINE__, __func__}, UNSEAL_SPDLOG_LEVEL(LEVEL),   \
                 __VA_ARGS__);                                                                     \
    }                                                                                              \
  } while (0)

/**
 * Convenience macro to log to a user-specified logger.
 */
#define UNSEAL_LOG_TO_LOGGER(LOGGER, LEVEL, ...)                                                   \
  UNSEAL_LOG_COMP_AND_LOG(LOGGER, LEVEL, ##__VA_ARGS__)

/**
 * Convenience macro to get logger.
 */
#define UNSEAL_LOGGER() __log_do_not_use_read_comment()

/**
 * Convenience macro to log to the misc logger, which allows for logging without of direct access to
 * a logger.
 */
#define GET_MISC_LOGGER() ::Unseal::Logger::Registry::getLog(::Unseal::Logger::Id::misc)
#define UNSEAL_LOG_MISC(LEVEL, ...) UNSEAL_LOG_TO_LOGGER(GET_MISC_LOGGER(), LEVEL, ##__VA_ARGS__)

/**
 * Log to the logger of the enclosing Loggable.
 */
#define UNSEAL_LOG(LEVEL, ...) UNSEAL_LOG_TO_LOGGER(UNSEAL_LOGGER(), LEVEL, ##__VA_ARGS__)

} // namespace Unseal
