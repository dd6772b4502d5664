#pragma once

#include <QtCore/QChar>
#include <QtCore/QString>
#include "../common/Expected.hpp"
#include "SearchTypes.hpp"

namespace WordFinder {

struct TimestampOptions {
    bool alwaysIncludeHours = false;
    bool includeMilliseconds = true;
    QChar decimalMarker = QLatin1Char('.');
};

/**
 * @brief Converts a second offset into a fixed-width clock string
 *
 * Output is [HH:]MM:SS[.mmm]. Hours appear when non-zero or when requested;
 * every field is zero-padded. Sub-millisecond precision is truncated.
 */
class TimestampFormatter {
public:
    /**
     * @brief Format a non-negative offset
     * @param seconds Offset in seconds
     * @param options Hour and millisecond rendering
     * @return Formatted string, or SearchError::InvalidTimestamp for negative,
     *         non-finite or out-of-range input
     */
    static Expected<QString, SearchError> format(double seconds,
                                                 const TimestampOptions& options = TimestampOptions());

    /**
     * @brief Second-precision form used in reports ("00:12", "01:01:01")
     */
    static Expected<QString, SearchError> formatDisplay(double seconds);

private:
    static constexpr qint64 MS_PER_SECOND = 1000;
    static constexpr qint64 MS_PER_MINUTE = 60 * MS_PER_SECOND;
    static constexpr qint64 MS_PER_HOUR = 60 * MS_PER_MINUTE;

    // Keeps seconds * 1000 well inside qint64
    static constexpr double MAX_SECONDS = 9.0e12;
};

} // namespace WordFinder
