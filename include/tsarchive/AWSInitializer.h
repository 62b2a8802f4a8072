/**
 * AWSInitializer.h - Global AWS SDK initialization and S3 client management
 *
 * The SDK must be initialized once per process and shut down before exit, so
 * its lifetime is owned by a single instance. The S3 client built here is
 * shared by every S3DataSource.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>

struct S3ClientSettings {
    std::string region = "us-east-1";
    std::string endpoint_override;   // empty: regular AWS endpoint
    long connect_timeout_ms = 5000;
    long request_timeout_ms = 30000;
    bool anonymous = false;          // public mirrors need no credentials
};

class AWSInitializer {
public:
    static AWSInitializer& instance();

    bool is_initialized() const;

    std::shared_ptr<Aws::S3::S3Client> get_s3_client() const;

    /**
     * @brief Initialize the SDK and build the shared client. No-op when
     *        already initialized.
     */
    void initialize(const S3ClientSettings& settings = S3ClientSettings());

    void shutdown();

    ~AWSInitializer();

private:
    AWSInitializer();

    static std::unique_ptr<AWSInitializer> instance_;
    static std::mutex instance_mutex_;

    bool initialized_{false};
    Aws::SDKOptions aws_options_;
    std::shared_ptr<Aws::S3::S3Client> s3_client_;
    mutable std::mutex state_mutex_;
};
