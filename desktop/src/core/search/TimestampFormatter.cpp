#include "TimestampFormatter.hpp"

#include <cmath>

namespace WordFinder {

namespace {
QString pad(qint64 value, int width) {
    return QString::number(value).rightJustified(width, QLatin1Char('0'));
}
} // namespace

Expected<QString, SearchError> TimestampFormatter::format(double seconds,
                                                          const TimestampOptions& options) {
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds > MAX_SECONDS) {
        return makeUnexpected(SearchError::InvalidTimestamp);
    }

    const qint64 totalMs = static_cast<qint64>(seconds * 1000.0);
    const qint64 milliseconds = totalMs % MS_PER_SECOND;
    const qint64 hours = totalMs / MS_PER_HOUR;
    const qint64 remainder = totalMs % MS_PER_HOUR;
    const qint64 minutes = remainder / MS_PER_MINUTE;
    const qint64 wholeSeconds = (remainder % MS_PER_MINUTE) / MS_PER_SECOND;

    QString result;
    if (options.alwaysIncludeHours || hours > 0) {
        result += pad(hours, 2) + QLatin1Char(':');
    }
    result += pad(minutes, 2) + QLatin1Char(':') + pad(wholeSeconds, 2);
    if (options.includeMilliseconds) {
        result += options.decimalMarker + pad(milliseconds, 3);
    }
    return result;
}

Expected<QString, SearchError> TimestampFormatter::formatDisplay(double seconds) {
    TimestampOptions options;
    options.includeMilliseconds = false;
    return format(seconds, options);
}

} // namespace WordFinder
