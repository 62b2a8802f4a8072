/**
 * S3DataSource.cpp - Implementation
 */

#include "tsarchive/S3DataSource.h"
#include "tsarchive/AWSInitializer.h"
#include "tsarchive/ChunkFile.h"
#include "tsarchive/Frequency.h"
#include <algorithm>
#include <iostream>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/GetObjectRequest.h>

namespace {
    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }
}

FetchError::Category classify_s3_error(int http_status, const std::string& exception_name) {
    static const char* FATAL_EXCEPTIONS[] = {
        "AccessDenied",
        "InvalidAccessKeyId",
        "SignatureDoesNotMatch",
        "ExpiredToken",
        "InvalidToken",
        "AllAccessDisabled",
        "NoSuchBucket"
    };

    if (http_status == 401 || http_status == 403) {
        return FetchError::Category::Fatal;
    }
    for (const char* name : FATAL_EXCEPTIONS) {
        if (exception_name == name) return FetchError::Category::Fatal;
    }
    return FetchError::Category::Transient;
}

S3DataSource::S3DataSource(std::string bucket,
                           std::string prefix,
                           std::shared_ptr<Aws::S3::S3Client> client)
    : bucket_(std::move(bucket)), prefix_(std::move(prefix)), client_(std::move(client)) {
    while (!prefix_.empty() && prefix_.back() == '/') prefix_.pop_back();
}

std::string S3DataSource::name() const {
    return "s3://" + bucket_ + (prefix_.empty() ? "" : "/" + prefix_);
}

std::shared_ptr<Aws::S3::S3Client> S3DataSource::client() const {
    if (client_) return client_;
    return AWSInitializer::instance().get_s3_client();
}

std::string S3DataSource::object_key(const std::string& series_id, Frequency frequency, int64_t range_start) const {
    std::string key = prefix_.empty() ? "" : prefix_ + "/";
    key += frequency_name(frequency) + "/" + series_id + "/" + chunk_name(frequency, range_start) + ".csv";
    return key;
}

RowTable S3DataSource::fetch(const std::string& series_id,
                             Frequency frequency,
                             int64_t range_start,
                             int64_t range_end) {
    using namespace Aws::S3::Model;

    auto s3_client = client();
    if (!s3_client) {
        throw FetchError(FetchError::Category::Transient, "S3 client not initialized");
    }

    const std::string key = object_key(series_id, frequency, range_start);

    GetObjectRequest get_req;
    get_req.WithBucket(bucket_).WithKey(key);

    auto get_outcome = s3_client->GetObject(get_req);
    if (!get_outcome.IsSuccess()) {
        const auto& error = get_outcome.GetError();
        int status = static_cast<int>(error.GetResponseCode());
        bool missing_object = error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY ||
                              (status == 404 && error.GetExceptionName() != "NoSuchBucket");
        if (missing_object) {
            return RowTable{};
        }
        auto category = classify_s3_error(status, error.GetExceptionName());
        std::string message = "GetObject " + key + " failed (" + std::to_string(status) + " " +
                              error.GetExceptionName() + "): " + error.GetMessage();
        log_error(message);
        throw FetchError(category, message);
    }

    auto result = get_outcome.GetResultWithOwnership();
    auto& stream = result.GetBody();

    std::string body;
    char temp_buf[65536];
    while (stream.read(temp_buf, sizeof(temp_buf))) {
        body.append(temp_buf, static_cast<size_t>(stream.gcount()));
    }
    if (stream.gcount() > 0) {
        body.append(temp_buf, static_cast<size_t>(stream.gcount()));
    }

    RowTable table;
    try {
        table = chunk_file::parse_csv(body);
    } catch (const std::exception& e) {
        throw FetchError(FetchError::Category::Transient, "Malformed object " + key + ": " + e.what());
    }

    // Mirror objects cover the whole aligned window; keep only the requested range.
    table.rows.erase(std::remove_if(table.rows.begin(), table.rows.end(), [&](const RowTable::Row& row) {
        return row.timestamp < range_start || row.timestamp >= range_end;
    }), table.rows.end());
    return table;
}
