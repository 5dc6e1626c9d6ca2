#include "storage_gateway.hpp"
#include "errors.hpp"
#include "process.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <random>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace roto {

namespace {

bool is_missing_object(const std::string& error_output) {
    return error_output.find("NoSuchKey") != std::string::npos ||
           error_output.find("Not Found") != std::string::npos ||
           error_output.find("(404)") != std::string::npos;
}

std::string random_hex(int digits) {
    static const char* kHex = "0123456789abcdef";
    std::random_device rd;
    std::string text;
    for (int i = 0; i < digits; ++i) {
        text += kHex[rd() % 16];
    }
    return text;
}

std::atomic<uint64_t> scratch_counter{0};

} // namespace

AwsCliObjectStore::AwsCliObjectStore(std::string aws_cli, std::string region)
    : aws_cli_(std::move(aws_cli)), region_(std::move(region)) {}

void AwsCliObjectStore::run(const std::string& operation, const std::string& bucket,
                            const std::string& key, const std::string& args, const Deadline& deadline) {
    std::string command = join_command({aws_cli_, "s3api", operation,
                                        "--bucket", bucket, "--key", key,
                                        "--region", region_, "--output", "json"}) + args;
    if (deadline.bounded()) {
        command = with_time_limit(command, std::max<long>(1, static_cast<long>(deadline.remaining().count())));
    }

    CommandResult result = run_command(command);
    if (result.ok()) {
        return;
    }

    std::string target = "s3://" + bucket + "/" + key;
    if (deadline.bounded() && result.exit_code == kTimeoutExitCode) {
        throw JobTimeoutError("aws s3api " + operation + " " + target + " exceeded the job deadline");
    }
    if (is_missing_object(result.error_output)) {
        throw NotFoundError("Object not found: " + target);
    }
    throw TransientError("aws s3api " + operation + " " + target + " exited with code " +
                         std::to_string(result.exit_code) + ": " + result.error_output);
}

void AwsCliObjectStore::get_object(const std::string& bucket, const std::string& key,
                                   const std::string& local_path, const Deadline& deadline) {
    run("get-object", bucket, key, " " + shell_quote(local_path), deadline);
}

void AwsCliObjectStore::put_object(const std::string& bucket, const std::string& key,
                                   const std::string& local_path, const std::string& content_type,
                                   const Deadline& deadline) {
    run("put-object", bucket, key,
        " --body " + shell_quote(local_path) + " --content-type " + shell_quote(content_type), deadline);
}

void AwsCliObjectStore::delete_object(const std::string& bucket, const std::string& key) {
    run("delete-object", bucket, key, "", Deadline());
}

LocalObjectStore::LocalObjectStore(std::string root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw ConfigError("Cannot create local store at " + root_ + ": " + ec.message());
    }
}

std::string LocalObjectStore::path_for(const std::string& bucket, const std::string& key) const {
    if (bucket.empty() || key.empty()) {
        throw ValidationError("Bucket and key must be non-empty");
    }
    fs::path relative = fs::path(key).lexically_normal();
    if (relative.is_absolute() || bucket.find('/') != std::string::npos ||
        (!relative.empty() && *relative.begin() == "..")) {
        throw ValidationError("Key escapes the bucket: " + key);
    }
    return (fs::path(root_) / bucket / relative).string();
}

void LocalObjectStore::get_object(const std::string& bucket, const std::string& key,
                                  const std::string& local_path, const Deadline& /*deadline*/) {
    std::string source = path_for(bucket, key);
    if (!fs::is_regular_file(source)) {
        throw NotFoundError("Object not found: " + bucket + "/" + key);
    }
    std::error_code ec;
    fs::copy_file(source, local_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw TransientError("Copy " + source + " failed: " + ec.message());
    }
}

void LocalObjectStore::put_object(const std::string& bucket, const std::string& key,
                                  const std::string& local_path, const std::string& /*content_type*/,
                                  const Deadline& /*deadline*/) {
    fs::path target = path_for(bucket, key);
    fs::path staging = target;
    staging += ".partial";

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (!ec) fs::copy_file(local_path, staging, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::rename(staging, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        throw TransientError("Store " + target.string() + " failed: " + ec.message());
    }
}

void LocalObjectStore::delete_object(const std::string& bucket, const std::string& key) {
    std::error_code ec;
    fs::remove(path_for(bucket, key), ec);
    if (ec) {
        throw TransientError("Delete " + bucket + "/" + key + " failed: " + ec.message());
    }
}

ScratchSpace::ScratchSpace(const std::string& parent_dir) {
    std::ostringstream name;
    name << "roto-" << getpid() << "-" << scratch_counter.fetch_add(1) << "-" << random_hex(8);
    path_ = (fs::path(parent_dir) / name.str()).string();

    std::error_code ec;
    if (!fs::create_directories(path_, ec) || ec) {
        throw TransientError("Cannot create scratch directory " + path_ +
                             (ec ? ": " + ec.message() : ""));
    }
}

ScratchSpace::~ScratchSpace() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::cerr << "Failed to remove scratch directory " << path_ << ": " << ec.message() << std::endl;
    }
}

std::string ScratchSpace::file(const std::string& name) const {
    return (fs::path(path_) / name).string();
}

StorageGateway::StorageGateway(std::shared_ptr<ObjectStore> store, RetryPolicy policy)
    : store_(std::move(store)), policy_(policy) {}

void StorageGateway::download(const std::string& bucket, const std::string& key,
                              const std::string& local_path, const Deadline& deadline) {
    with_retry(policy_, "Download " + bucket + "/" + key, deadline, [&]() {
        store_->get_object(bucket, key, local_path, deadline);
    });
}

void StorageGateway::upload(const std::string& bucket, const std::string& key,
                            const std::string& local_path, const std::string& content_type,
                            const Deadline& deadline) {
    with_retry(policy_, "Upload " + bucket + "/" + key, deadline, [&]() {
        store_->put_object(bucket, key, local_path, content_type, deadline);
    });
}

void StorageGateway::remove(const std::string& bucket, const std::string& key) {
    with_retry(policy_, "Delete " + bucket + "/" + key, [&]() {
        store_->delete_object(bucket, key);
    });
}

} // namespace roto
