#include <ctime>
#include <jailer/errmsg.hh>
#include <jailer/logger.hh>
#include <jailer/macros/throw.hh>

Logger::Logger(const char* path) : f_(fopen(path, "abe")), opened_(true) {
    if (f_ == nullptr) {
        THROW("fopen('", path, "') failed", errmsg());
    }
}

void Logger::open(const char* path) {
    FILE* f = fopen(path, "abe");
    if (f == nullptr) {
        THROW("fopen('", path, "') failed", errmsg());
    }
    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (label_) {
            char date[32];
            time_t now = time(nullptr);
            struct tm tm_buff = {};
            if (localtime_r(&now, &tm_buff) and
                strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buff) > 0)
            {
                (void)fprintf(
                    logger_.f_, "[ %s ] %.*s\n", date, static_cast<int>(buff_.size()), buff_.data()
                );
            } else {
                (void)fprintf(
                    logger_.f_,
                    "[ unknown time ] %.*s\n",
                    static_cast<int>(buff_.size()),
                    buff_.data()
                );
            }
        } else {
            (void)fprintf(logger_.f_, "%.*s\n", static_cast<int>(buff_.size()), buff_.data());
        }
        (void)fflush(logger_.f_);
        logger_.unlock();
    }

    flushed_ = true;
    buff_.clear();
}
