#include <cumulus/storage/s3.hpp>

#if defined(WITH_AWS_DEPLOYMENT)

#include <cumulus/common/exceptions.hpp>

#include <algorithm>
#include <iterator>
#include <memory>

#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/s3/model/Delete.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/DeleteObjectsRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/ObjectIdentifier.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <spdlog/spdlog.h>

namespace cumulus::storage {

  std::optional<S3Storage::S3API> S3Storage::api;

  S3Storage::S3API::S3API()
  {
    Aws::InitAPI(_s3_options);
  }

  S3Storage::S3API::~S3API()
  {
    Aws::ShutdownAPI(_s3_options);
  }

  S3Storage::S3Storage(const config::AWSS3& cfg, std::string bucket)
      : ObjectStorage(std::move(bucket))
  {
    if (!api.has_value()) {
      api.emplace();
    }

    // https://github.com/aws/aws-sdk-cpp/issues/1410
    putenv(const_cast<char*>("AWS_EC2_METADATA_DISABLED=true"));
    Aws::Client::ClientConfiguration client_cfg("default", true);
    client_cfg.maxConnections = MAX_CONNECTIONS;
    if (!cfg.region.empty()) {
      client_cfg.region = cfg.region;
    }
    if (!cfg.endpoint.empty()) {
      client_cfg.endpointOverride = cfg.endpoint;
    }

    if (cfg.access_key_id.has_value()) {
      Aws::Auth::AWSCredentials credentials{
          cfg.access_key_id.value(), cfg.secret_access_key.value()};
      _s3_client.emplace(
          credentials, client_cfg, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
          // Custom endpoints (MinIO, Ceph) need path-style addressing.
          cfg.endpoint.empty()
      );
    } else {
      _s3_client.emplace(client_cfg);
    }
  }

  void S3Storage::put(const std::string& key, const std::string& data)
  {
    Aws::S3::Model::PutObjectRequest req;
    req.SetBucket(_bucket);
    req.SetKey(key);

    // The SDK requires a mutable stream; it only reads from it.
    std::shared_ptr<Aws::IOStream> input_data = std::make_shared<boost::interprocess::bufferstream>(
        const_cast<char*>(data.data()), data.size()
    );
    req.SetBody(input_data);

    auto outcome = _s3_client->PutObject(req);
    if (!outcome.IsSuccess()) {
      throw common::StorageError{fmt::format(
          "Error uploading object {}, error {}", key, outcome.GetError().GetMessage()
      )};
    }
    SPDLOG_DEBUG("Successfully uploaded object {}", key);
  }

  std::string S3Storage::get(const std::string& key, std::optional<ByteRange> range)
  {
    Aws::S3::Model::GetObjectRequest req;
    req.SetBucket(_bucket);
    req.SetKey(key);
    if (range.has_value()) {
      req.SetRange(fmt::format("bytes={}-{}", range->first, range->last));
    }

    auto outcome = _s3_client->GetObject(req);
    if (!outcome.IsSuccess()) {
      if (outcome.GetError().GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY) {
        throw common::ObjectDoesNotExist{key};
      }
      throw common::StorageError{fmt::format(
          "Error downloading object {}, error {}", key, outcome.GetError().GetMessage()
      )};
    }

    auto& body = outcome.GetResult().GetBody();
    return std::string{std::istreambuf_iterator<char>(body), std::istreambuf_iterator<char>()};
  }

  std::vector<std::string> S3Storage::list(const std::string& prefix)
  {
    std::vector<std::string> keys;

    Aws::S3::Model::ListObjectsV2Request list_request;
    list_request.SetBucket(_bucket);
    list_request.SetPrefix(prefix);

    while (true) {

      auto result = _s3_client->ListObjectsV2(list_request);
      if (!result.IsSuccess()) {
        throw common::StorageError{fmt::format(
            "Error listing {} in {}, error {}", prefix, _bucket, result.GetError().GetMessage()
        )};
      }

      for (const auto& object : result.GetResult().GetContents()) {
        keys.emplace_back(object.GetKey());
      }

      if (result.GetResult().GetIsTruncated()) {
        list_request.SetContinuationToken(result.GetResult().GetNextContinuationToken());
      } else {
        break;
      }
    }

    return keys;
  }

  void S3Storage::remove(const std::string& key)
  {
    Aws::S3::Model::DeleteObjectRequest req;
    req.SetBucket(_bucket);
    req.SetKey(key);

    auto outcome = _s3_client->DeleteObject(req);
    if (!outcome.IsSuccess()) {
      throw common::StorageError{fmt::format(
          "Error deleting object {}, error {}", key, outcome.GetError().GetMessage()
      )};
    }
  }

  void S3Storage::remove(const std::vector<std::string>& keys)
  {
    // A single request accepts at most 1000 keys.
    static constexpr size_t MAX_KEYS = 1000;

    for (size_t begin = 0; begin < keys.size(); begin += MAX_KEYS) {

      Aws::S3::Model::Delete objects;
      for (size_t i = begin; i < std::min(keys.size(), begin + MAX_KEYS); ++i) {
        objects.AddObjects(Aws::S3::Model::ObjectIdentifier{}.WithKey(keys[i]));
      }

      Aws::S3::Model::DeleteObjectsRequest req;
      req.SetBucket(_bucket);
      req.SetDelete(objects);

      auto outcome = _s3_client->DeleteObjects(req);
      if (!outcome.IsSuccess()) {
        throw common::StorageError{fmt::format(
            "Error deleting objects from {}, error {}", _bucket, outcome.GetError().GetMessage()
        )};
      }
    }
  }

} // namespace cumulus::storage

#endif
