#pragma once

#include <atomic>
#include <cstdio>
#include <jailer/concat_tostr.hh>
#include <string>
#include <utility>

class Logger {
    FILE* f_;
    std::atomic<bool> opened_{false};
    std::atomic<bool> label_{true};

    void close() noexcept {
        if (opened_.exchange(false)) {
            (void)fclose(f_);
        }
    }

    bool lock() noexcept {
        if (f_ == nullptr) {
            return false;
        }
        flockfile(f_);
        return true;
    }

    void unlock() noexcept { funlockfile(f_); }

public:
    // Opens @p path in append mode, throws std::runtime_error on failure
    explicit Logger(const char* path);

    // nullptr makes the logger discard everything
    explicit Logger(FILE* stream) noexcept : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // On fopen() error throws and leaves the current stream unchanged
    void open(const char* path);

    // nullptr makes the logger discard everything
    void use(FILE* stream) noexcept {
        close();
        f_ = stream;
    }

    FILE* exchange_log_stream(FILE* stream) noexcept { return std::exchange(f_, stream); }

    [[nodiscard]] bool label() const noexcept { return label_.load(std::memory_order_relaxed); }

    bool label(bool add_label) noexcept { return label_.exchange(add_label); }

    class Appender {
        friend class Logger;

        Logger& logger_;
        bool flushed_ = true;
        bool label_;
        std::string buff_;

        explicit Appender(Logger& logger) : logger_(logger), label_(logger.label()) {}

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        explicit Appender(Logger& logger, Args&&... args) : Appender(logger) {
            operator()(std::forward<Args>(args)...);
        }

    public:
        Appender(const Appender&) = delete;

        Appender(Appender&& app) noexcept
        : logger_(app.logger_)
        , flushed_(std::exchange(app.flushed_, true))
        , label_(app.label_)
        , buff_(std::move(app.buff_)) {}

        Appender& operator=(const Appender&) = delete;
        Appender& operator=(Appender&&) = delete;

        template <class T>
        Appender& operator<<(T&& x) {
            return operator()(std::forward<T>(x));
        }

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        Appender& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            flushed_ = false;
            return *this;
        }

        void flush() noexcept;

        ~Appender() { flush(); }
    };

    template <class T>
    Appender operator<<(T&& x) {
        return Appender(*this, std::forward<T>(x));
    }

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    Appender operator()(Args&&... args) {
        return Appender(*this, std::forward<Args>(args)...);
    }

    Appender get_appender() { return Appender(*this); }

    ~Logger() { close(); }
};

// By default both write to stderr
inline Logger stdlog(stderr); // Standard log
inline Logger errlog(stderr); // Error log

// Logs to a Logger and appends the same text (one line per message) to a string
class DoubleAppender {
    Logger::Appender app_;
    std::string& str_;

public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    DoubleAppender(Logger& logger, std::string& str, Args&&... args)
    : app_(logger(args...))
    , str_(str) {
        if (!str_.empty()) {
            str_ += '\n';
        }
        back_insert(str_, std::forward<Args>(args)...);
    }

    DoubleAppender(const DoubleAppender&) = delete;
    DoubleAppender(DoubleAppender&&) = delete;
    DoubleAppender& operator=(const DoubleAppender&) = delete;
    DoubleAppender& operator=(DoubleAppender&&) = delete;

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    DoubleAppender& operator()(Args&&... args) {
        back_insert(str_, args...);
        app_(std::forward<Args>(args)...);
        return *this;
    }

    ~DoubleAppender() = default;
};
