// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_storage_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/core/config/AWSProfileConfigLoader.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/BucketLocationConstraint.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateBucketConfiguration.h>
#include <aws/s3/model/CreateBucketRequest.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/DeleteBucketRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <iterator>
#include <mutex>
#include <stdexcept>

#include "s3_client_test_helpers.hpp"
#include "s3_retry_strategy.hpp"

#define FERRY_LOG_COMPONENT "s3_client"
#include "ferry_log_macros.hpp"

namespace ferry {
namespace storage {

namespace {

constexpr const char* kAllocationTag = "FerryS3";

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// Aws::InitAPI/ShutdownAPI must bracket every SDK object. Source and
// destination clients share one reference-counted initialization.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

template <typename ErrorType>
StorageError toStorageError(const Aws::Client::AWSError<ErrorType>& error) {
  StorageError result;
  result.code = error.GetExceptionName();
  result.message = error.GetMessage();
  if (result.code.empty()) {
    result.code = "HTTP" + std::to_string(static_cast<int>(error.GetResponseCode()));
  }
  if (result.message.empty()) {
    result.message = result.code;
  }
  switch (classifyErrorCode(result.code)) {
    case ErrorClass::TRANSIENT:
      result.is_retryable = true;
      break;
    case ErrorClass::SEMANTIC:
      result.is_retryable = false;
      break;
    default:
      result.is_retryable = error.ShouldRetry();
  }
  return result;
}

std::shared_ptr<Aws::Auth::AWSCredentialsProvider> makeCredentialsProvider(const S3Config& config) {
  if (!config.credentials_file.empty()) {
    Aws::Config::AWSConfigFileProfileConfigLoader loader(config.credentials_file, false);
    if (!loader.Load()) {
      throw std::runtime_error("Cannot read credentials file: " + config.credentials_file);
    }
    const auto& profiles = loader.GetProfiles();
    auto it = profiles.find(config.profile);
    if (it == profiles.end()) {
      throw std::runtime_error(
        "Profile '" + config.profile + "' not found in " + config.credentials_file
      );
    }
    auto credentials = it->second.GetCredentials();
    if (credentials.GetAWSAccessKeyId().empty() || credentials.GetAWSSecretKey().empty()) {
      throw std::runtime_error(
        "Profile '" + config.profile + "' in " + config.credentials_file +
        " has no access key pair"
      );
    }
    return Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(kAllocationTag, credentials);
  }

  if (!config.access_key.empty() && !config.secret_key.empty()) {
    return Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(
      kAllocationTag, config.access_key, config.secret_key
    );
  }

  return Aws::MakeShared<Aws::Auth::DefaultAWSCredentialsProviderChain>(kAllocationTag);
}

}  // namespace

// =============================================================================
// Helpers exposed for tests
// =============================================================================

std::string normalizeEndpointUrl(const std::string& endpoint_url) {
  std::string endpoint = endpoint_url;
  if (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  return endpoint;
}

std::optional<CreateBucketOutcome> classifyCreateBucketConflict(const std::string& exception_name) {
  if (exception_name == "BucketAlreadyOwnedByYou") {
    return CreateBucketOutcome::ALREADY_OWNED_BY_YOU;
  }
  if (exception_name == "BucketAlreadyExists") {
    return CreateBucketOutcome::ALREADY_EXISTS;
  }
  return std::nullopt;
}

bool isTruncatedWithoutToken(bool is_truncated, const std::string& continuation_token) {
  return is_truncated && continuation_token.empty();
}

bool isShortRead(int64_t content_length, size_t received) {
  // Zero means the provider sent no Content-Length (chunked encoding)
  return content_length > 0 && received != static_cast<size_t>(content_length);
}

// =============================================================================
// S3StorageClient Implementation
// =============================================================================

class S3StorageClient::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() { AwsSdkManager::instance().addRef(); }

  ~Impl() {
    // SDK objects must be gone before release() may call Aws::ShutdownAPI()
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      client_config.endpointOverride = normalizeEndpointUrl(config.endpoint_url);
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;

    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.maxConnections = static_cast<unsigned>(config.max_connections);

    client_config.retryStrategy = Aws::MakeShared<S3RetryStrategy>(kAllocationTag, config.retry);

    // 4th parameter is useVirtualAddressing: path style for every provider
    client = Aws::MakeShared<Aws::S3::S3Client>(
      kAllocationTag,
      makeCredentialsProvider(config),
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      false
    );
  }
};

S3StorageClient::S3StorageClient(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;
  impl_->initClient();
  FERRY_LOG_DEBUG(
    "S3 client ready" << ::ferry::logging::kv("region", config.region)
                      << ::ferry::logging::kv("endpoint", config.endpoint_url)
  );
}

S3StorageClient::~S3StorageClient() = default;

StorageResult<std::vector<std::string>> S3StorageClient::listBuckets() {
  auto outcome = impl_->client->ListBuckets();
  if (!outcome.IsSuccess()) {
    auto error = toStorageError(outcome.GetError());
    FERRY_LOG_ERROR("ListBuckets failed: " << error.message << ::ferry::logging::kv("code", error.code));
    return StorageResult<std::vector<std::string>>::Failure(error);
  }

  std::vector<std::string> names;
  for (const auto& bucket : outcome.GetResult().GetBuckets()) {
    names.emplace_back(bucket.GetName());
  }
  return StorageResult<std::vector<std::string>>::Success(std::move(names));
}

StorageResult<CreateBucketOutcome> S3StorageClient::createBucket(const std::string& bucket) {
  Aws::S3::Model::CreateBucketRequest request;
  request.SetBucket(bucket);

  // us-east-1 rejects an explicit location constraint
  if (!impl_->config.region.empty() && impl_->config.region != "us-east-1") {
    Aws::S3::Model::CreateBucketConfiguration bucket_config;
    bucket_config.SetLocationConstraint(
      Aws::S3::Model::BucketLocationConstraintMapper::GetBucketLocationConstraintForName(
        impl_->config.region
      )
    );
    request.SetCreateBucketConfiguration(bucket_config);
  }

  auto outcome = impl_->client->CreateBucket(request);
  if (outcome.IsSuccess()) {
    return StorageResult<CreateBucketOutcome>::Success(CreateBucketOutcome::CREATED);
  }

  const auto& error = outcome.GetError();
  switch (error.GetErrorType()) {
    case Aws::S3::S3Errors::BUCKET_ALREADY_OWNED_BY_YOU:
      return StorageResult<CreateBucketOutcome>::Success(CreateBucketOutcome::ALREADY_OWNED_BY_YOU);
    case Aws::S3::S3Errors::BUCKET_ALREADY_EXISTS:
      return StorageResult<CreateBucketOutcome>::Success(CreateBucketOutcome::ALREADY_EXISTS);
    default:
      break;
  }

  // Some providers only report the conflict by name
  if (auto conflict = classifyCreateBucketConflict(error.GetExceptionName())) {
    return StorageResult<CreateBucketOutcome>::Success(*conflict);
  }

  auto storage_error = toStorageError(error);
  FERRY_LOG_ERROR(
    "CreateBucket failed: " << storage_error.message << ::ferry::logging::kv("bucket", bucket)
                            << ::ferry::logging::kv("code", storage_error.code)
  );
  return StorageResult<CreateBucketOutcome>::Failure(storage_error);
}

StorageStatus S3StorageClient::deleteBucket(const std::string& bucket) {
  Aws::S3::Model::DeleteBucketRequest request;
  request.SetBucket(bucket);

  auto outcome = impl_->client->DeleteBucket(request);
  if (!outcome.IsSuccess()) {
    return StorageStatus::Failure(toStorageError(outcome.GetError()));
  }
  return StorageStatus::Ok();
}

StorageResult<ObjectPage> S3StorageClient::listObjects(
  const std::string& bucket, const std::string& continuation, int page_size
) {
  Aws::S3::Model::ListObjectsV2Request request;
  request.SetBucket(bucket);
  if (page_size > 0) {
    request.SetMaxKeys(page_size);
  }
  if (!continuation.empty()) {
    request.SetContinuationToken(continuation);
  }

  auto outcome = impl_->client->ListObjectsV2(request);
  if (!outcome.IsSuccess()) {
    return StorageResult<ObjectPage>::Failure(toStorageError(outcome.GetError()));
  }

  const auto& result = outcome.GetResult();
  ObjectPage page;
  page.objects.reserve(result.GetContents().size());
  for (const auto& object : result.GetContents()) {
    ObjectSummary summary;
    summary.key = object.GetKey();
    summary.size_bytes = static_cast<uint64_t>(object.GetSize());
    page.objects.push_back(std::move(summary));
  }
  const auto& aws_token = result.GetNextContinuationToken();
  const std::string next_token(aws_token.c_str(), aws_token.size());
  if (isTruncatedWithoutToken(result.GetIsTruncated(), next_token)) {
    return StorageResult<ObjectPage>::Failure(
      "Listing of " + bucket + " is truncated but carries no continuation token",
      "TruncatedWithoutToken"
    );
  }
  if (result.GetIsTruncated()) {
    page.next_continuation = next_token;
  }
  return StorageResult<ObjectPage>::Success(std::move(page));
}

StorageResult<ObjectPayload> S3StorageClient::getObject(
  const std::string& bucket, const std::string& key
) {
  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = impl_->client->GetObject(request);
  if (!outcome.IsSuccess()) {
    return StorageResult<ObjectPayload>::Failure(toStorageError(outcome.GetError()));
  }

  auto result = outcome.GetResultWithOwnership();
  auto& body = result.GetBody();
  ObjectPayload payload;
  const auto expected = result.GetContentLength();
  if (expected > 0) {
    payload.reserve(static_cast<size_t>(expected));
  }
  payload.assign(std::istreambuf_iterator<char>(body), std::istreambuf_iterator<char>());

  if (isShortRead(expected, payload.size())) {
    return StorageResult<ObjectPayload>::Failure(
      "Short read: got " + std::to_string(payload.size()) + " of " + std::to_string(expected) +
        " bytes",
      "IncompleteBody",
      true
    );
  }
  return StorageResult<ObjectPayload>::Success(std::move(payload));
}

StorageStatus S3StorageClient::putObject(
  const std::string& bucket, const std::string& key, const ObjectPayload& payload
) {
  auto body = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
  body->write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));

  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetContentLength(static_cast<long long>(payload.size()));
  request.SetContentType("application/octet-stream");
  request.SetBody(body);

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    return StorageStatus::Failure(toStorageError(outcome.GetError()));
  }
  return StorageStatus::Ok();
}

StorageResult<std::string> S3StorageClient::createMultipartUpload(
  const std::string& bucket, const std::string& key
) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetContentType("application/octet-stream");

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return StorageResult<std::string>::Failure(toStorageError(outcome.GetError()));
  }
  const auto& upload_id = outcome.GetResult().GetUploadId();
  if (upload_id.empty()) {
    return StorageResult<std::string>::Failure("Provider returned no upload id", "MissingUploadId");
  }
  return StorageResult<std::string>::Success(std::string(upload_id));
}

StorageResult<std::string> S3StorageClient::uploadPart(
  const std::string& bucket, const std::string& key, const std::string& upload_id,
  int part_number, const uint8_t* data, size_t length
) {
  auto body = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
  body->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));

  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetPartNumber(part_number);
  request.SetContentLength(static_cast<long long>(length));
  request.SetBody(body);

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return StorageResult<std::string>::Failure(toStorageError(outcome.GetError()));
  }
  // Keep the tag exactly as issued; completion echoes it back
  const auto& etag = outcome.GetResult().GetETag();
  if (etag.empty()) {
    return StorageResult<std::string>::Failure("Provider returned no part tag", "MissingETag");
  }
  return StorageResult<std::string>::Success(std::string(etag));
}

StorageStatus S3StorageClient::completeMultipartUpload(
  const std::string& bucket, const std::string& key, const std::string& upload_id,
  const std::vector<CompletedPart>& parts
) {
  Aws::S3::Model::CompletedMultipartUpload completed;
  for (const auto& part : parts) {
    Aws::S3::Model::CompletedPart aws_part;
    aws_part.SetPartNumber(part.part_number);
    aws_part.SetETag(part.etag);
    completed.AddParts(aws_part);
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetMultipartUpload(completed);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return StorageStatus::Failure(toStorageError(outcome.GetError()));
  }
  return StorageStatus::Ok();
}

StorageStatus S3StorageClient::abortMultipartUpload(
  const std::string& bucket, const std::string& key, const std::string& upload_id
) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    auto error = toStorageError(outcome.GetError());
    if (outcome.GetError().GetErrorType() == Aws::S3::S3Errors::NO_SUCH_UPLOAD) {
      error.code = kErrorNoSuchUpload;
    }
    return StorageStatus::Failure(error);
  }
  return StorageStatus::Ok();
}

StorageStatus S3StorageClient::deleteObject(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::DeleteObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = impl_->client->DeleteObject(request);
  if (!outcome.IsSuccess()) {
    return StorageStatus::Failure(toStorageError(outcome.GetError()));
  }
  return StorageStatus::Ok();
}

const std::string& S3StorageClient::region() const {
  return impl_->config.region;
}

const std::string& S3StorageClient::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace storage
}  // namespace ferry
