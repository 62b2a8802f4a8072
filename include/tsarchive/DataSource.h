/**
 * DataSource.h - Remote fetch capability consumed by the orchestrator
 */

#pragma once

#include "tsarchive/ArchiveTypes.h"
#include <cstdint>
#include <string>

class DataSource {
public:
    virtual ~DataSource() = default;

    /**
     * @brief Fetch every row of one series in [range_start, range_end).
     *
     * Implementations own request timeouts and report them as Transient.
     *
     * @throws FetchError Transient (retry on a later run) or Fatal (halt the run).
     */
    virtual RowTable fetch(const std::string& series_id,
                           Frequency frequency,
                           int64_t range_start,
                           int64_t range_end) = 0;

    virtual std::string name() const = 0;
};
