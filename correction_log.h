#pragma once
#include <algorithm>
#include <utility>
#include <vector>

#include "site_records.h"

// Append-only audit trail of one correction pass, in processing order.
class CorrectionLog {
public:
    typedef std::vector<CorrectionEvent>::const_iterator const_iterator;

    void append(CorrectionEvent event) { events_.push_back(std::move(event)); }

    const std::vector<CorrectionEvent> &events() const { return events_; }
    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }
    const CorrectionEvent &operator[](size_t i) const { return events_[i]; }
    const_iterator begin() const { return events_.begin(); }
    const_iterator end() const { return events_.end(); }

    size_t count(CorrectionAction action) const {
        return static_cast<size_t>(std::count_if(
            events_.begin(), events_.end(),
            [action](const CorrectionEvent &e) { return e.action == action; }));
    }

private:
    std::vector<CorrectionEvent> events_;
};
