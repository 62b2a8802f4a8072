/**
 * S3DataSource.h - Vendor data served from an S3 mirror
 *
 * Objects are laid out exactly like the local archive:
 *   s3://<bucket>/<prefix>/<frequency>/<series>/<chunk>.csv
 * A missing object means the vendor has no rows for that window.
 */

#pragma once

#include "tsarchive/DataSource.h"
#include <memory>
#include <string>

namespace Aws { namespace S3 { class S3Client; } }

/**
 * @brief Map an S3 failure to a fetch error category. Credential and
 *        authorization failures are Fatal; everything else is Transient.
 */
FetchError::Category classify_s3_error(int http_status, const std::string& exception_name);

class S3DataSource : public DataSource {
public:
    /**
     * @param bucket Bucket holding the mirror.
     * @param prefix Key prefix, without trailing slash (may be empty).
     * @param client Shared client; defaults to AWSInitializer's.
     */
    S3DataSource(std::string bucket,
                 std::string prefix,
                 std::shared_ptr<Aws::S3::S3Client> client = nullptr);

    RowTable fetch(const std::string& series_id,
                   Frequency frequency,
                   int64_t range_start,
                   int64_t range_end) override;

    std::string name() const override;

    std::string object_key(const std::string& series_id, Frequency frequency, int64_t range_start) const;

private:
    std::string bucket_;
    std::string prefix_;
    std::shared_ptr<Aws::S3::S3Client> client_;

    std::shared_ptr<Aws::S3::S3Client> client() const;
};
