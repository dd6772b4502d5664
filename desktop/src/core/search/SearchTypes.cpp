#include "SearchTypes.hpp"

namespace WordFinder {

QString toString(SearchError error) {
    switch (error) {
        case SearchError::InvalidTimestamp:
            return "Segment has a negative or invalid start time";
    }
    return "Unknown search error";
}

} // namespace WordFinder
