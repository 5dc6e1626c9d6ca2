#pragma once

#include "deadline.hpp"
#include "retry.hpp"
#include <memory>
#include <string>

namespace roto {

// Blob storage. Missing objects throw NotFoundError; failures worth
// retrying throw TransientError.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Transfers stop with JobTimeoutError once the deadline passes.
    virtual void get_object(const std::string& bucket, const std::string& key,
                            const std::string& local_path, const Deadline& deadline) = 0;
    virtual void put_object(const std::string& bucket, const std::string& key,
                            const std::string& local_path, const std::string& content_type,
                            const Deadline& deadline) = 0;
    virtual void delete_object(const std::string& bucket, const std::string& key) = 0;

    virtual std::string name() const = 0;
};

// S3 through `aws s3api`.
class AwsCliObjectStore : public ObjectStore {
public:
    AwsCliObjectStore(std::string aws_cli, std::string region);

    void get_object(const std::string& bucket, const std::string& key,
                    const std::string& local_path, const Deadline& deadline) override;
    void put_object(const std::string& bucket, const std::string& key,
                    const std::string& local_path, const std::string& content_type,
                    const Deadline& deadline) override;
    void delete_object(const std::string& bucket, const std::string& key) override;

    std::string name() const override { return "s3"; }

private:
    void run(const std::string& operation, const std::string& bucket, const std::string& key,
             const std::string& args, const Deadline& deadline);

    std::string aws_cli_;
    std::string region_;
};

// One directory per bucket under `root`, keys map to relative paths.
class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(std::string root);

    void get_object(const std::string& bucket, const std::string& key,
                    const std::string& local_path, const Deadline& deadline) override;
    void put_object(const std::string& bucket, const std::string& key,
                    const std::string& local_path, const std::string& content_type,
                    const Deadline& deadline) override;
    void delete_object(const std::string& bucket, const std::string& key) override;

    std::string name() const override { return "local:" + root_; }

    // Throws ValidationError for keys that escape the bucket directory.
    std::string path_for(const std::string& bucket, const std::string& key) const;

private:
    std::string root_;
};

// Per-attempt working directory, removed with everything in it on
// destruction. Names are unique per process and per attempt.
class ScratchSpace {
public:
    explicit ScratchSpace(const std::string& parent_dir);
    ~ScratchSpace();

    ScratchSpace(const ScratchSpace&) = delete;
    ScratchSpace& operator=(const ScratchSpace&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const;

private:
    std::string path_;
};

class StorageGateway {
public:
    StorageGateway(std::shared_ptr<ObjectStore> store, RetryPolicy policy = RetryPolicy());

    void download(const std::string& bucket, const std::string& key, const std::string& local_path,
                  const Deadline& deadline = Deadline());
    void upload(const std::string& bucket, const std::string& key, const std::string& local_path,
                const std::string& content_type = "video/mp4", const Deadline& deadline = Deadline());
    void remove(const std::string& bucket, const std::string& key);

    ObjectStore& store() { return *store_; }

private:
    std::shared_ptr<ObjectStore> store_;
    RetryPolicy policy_;
};

} // namespace roto
