/**
 * AWSInitializer.cpp - Implementation
 */

#include "tsarchive/AWSInitializer.h"
#include <iostream>
#include <chrono>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/s3/S3Client.h>

std::unique_ptr<AWSInitializer> AWSInitializer::instance_ = nullptr;
std::mutex AWSInitializer::instance_mutex_;

AWSInitializer::AWSInitializer() = default;

AWSInitializer::~AWSInitializer() {
    shutdown();
}

AWSInitializer& AWSInitializer::instance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = std::unique_ptr<AWSInitializer>(new AWSInitializer());
    }
    return *instance_;
}

bool AWSInitializer::is_initialized() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return initialized_;
}

std::shared_ptr<Aws::S3::S3Client> AWSInitializer::get_s3_client() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return s3_client_;
}

void AWSInitializer::initialize(const S3ClientSettings& settings) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (initialized_) {
        return;
    }

    auto start_time = std::chrono::steady_clock::now();

    Aws::InitAPI(aws_options_);

    Aws::Client::ClientConfiguration aws_config;
    aws_config.region = settings.region;
    aws_config.connectTimeoutMs = settings.connect_timeout_ms;
    aws_config.requestTimeoutMs = settings.request_timeout_ms;
    // Requests are serialized by the rate limiter; one connection is plenty.
    aws_config.maxConnections = 2;
    if (!settings.endpoint_override.empty()) {
        aws_config.endpointOverride = settings.endpoint_override;
    }

    std::shared_ptr<Aws::Auth::AWSCredentialsProvider> creds;
    if (settings.anonymous) {
        creds = std::make_shared<Aws::Auth::AnonymousAWSCredentialsProvider>();
    } else {
        creds = std::make_shared<Aws::Auth::DefaultAWSCredentialsProviderChain>();
    }

    s3_client_ = std::make_shared<Aws::S3::S3Client>(
        creds,
        aws_config,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        // Path-style addressing keeps custom endpoints (MinIO etc.) working.
        settings.endpoint_override.empty()
    );

    initialized_ = true;

    auto end_time = std::chrono::steady_clock::now();
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "⚡ AWS SDK (S3-only) initialized in " << elapsed_ms << "ms" << std::endl;
}

void AWSInitializer::shutdown() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (!initialized_) {
        return;
    }

    s3_client_.reset();
    Aws::ShutdownAPI(aws_options_);
    initialized_ = false;

    std::cout << "✅ AWS SDK shutdown complete" << std::endl;
}
