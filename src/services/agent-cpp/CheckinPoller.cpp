#include "CheckinPoller.hpp"

#include "Encoding.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>
#include <utility>

namespace {
bool ReadFile(const std::string& path, std::string& outContent) {
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        return false;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return false;
    }
    outContent.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    return !input.bad();
}

bool WriteChunk(const std::string& path, const std::string& bytes, bool truncate) {
    const std::filesystem::path target = path;
    if (!target.parent_path().empty()) {
        std::error_code error;
        std::filesystem::create_directories(target.parent_path(), error);
        if (error) {
            return false;
        }
    }

    std::ofstream output(path, std::ios::binary | (truncate ? std::ios::trunc : std::ios::app));
    output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return output.good();
}

void RemovePartial(const std::string& path) {
    std::error_code ignored;
    std::filesystem::remove(path, ignored);
}
} // namespace

CheckinPoller::CheckinPoller(
    CheckinTransport transport,
    std::string identity,
    ClientMetadata metadata,
    CommandHandler handler,
    std::chrono::milliseconds interval,
    std::string workingDir)
    : transport_(std::move(transport)),
      identity_(std::move(identity)),
      metadata_(std::move(metadata)),
      handler_(std::move(handler)),
      interval_(interval),
      workingDir_(std::move(workingDir)) {}

CheckinPoller::~CheckinPoller() {
    Stop();
}

void CheckinPoller::Start() {
    if (running_.exchange(true)) {
        return;
    }

    worker_ = std::thread(&CheckinPoller::Run, this);
}

void CheckinPoller::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

void CheckinPoller::Run() {
    while (running_) {
        CheckinOnce();

        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, interval_, [this]() { return !running_; });
    }
}

bool CheckinPoller::HasPendingReport() const {
    return pendingResult_.has_value() || upload_.has_value();
}

std::string CheckinPoller::ResolvePath(const std::string& path) const {
    const std::filesystem::path requested = path;
    if (requested.is_absolute() || workingDir_.empty()) {
        return requested.string();
    }
    return (std::filesystem::path(workingDir_) / requested).string();
}

ChunkBlock CheckinPoller::NextUploadChunk() const {
    const std::int64_t offset = static_cast<std::int64_t>(upload_->nextChunk) * upload_->chunkSize;

    ChunkBlock chunk;
    chunk.jobId = upload_->jobId;
    chunk.sequenceNumber = upload_->nextChunk;
    chunk.bytes = upload_->content.substr(static_cast<size_t>(offset), static_cast<size_t>(upload_->chunkSize));
    chunk.checksum = Sha256Hex(chunk.bytes);
    chunk.totalSize = static_cast<std::int64_t>(upload_->content.size());
    return chunk;
}

bool CheckinPoller::CheckinOnce() {
    CheckinRequest request;
    request.identity = identity_;
    request.metadata = metadata_;
    // A result always goes first: it frees the delivery slot on the server.
    if (pendingResult_) {
        request.result = pendingResult_;
    } else if (upload_) {
        request.chunk = NextUploadChunk();
    }

    Delivery delivery;
    if (!transport_(request, delivery)) {
        return false;
    }

    if (request.result) {
        pendingResult_.reset();
    } else if (request.chunk) {
        ++upload_->nextChunk;
        if (upload_->nextChunk >= upload_->chunkCount) {
            std::cout << "[Agent] Upload " << upload_->jobId << " sent (" << upload_->content.size() << " bytes)" << std::endl;
            upload_.reset();
        }
    }

    HandleDelivery(delivery);
    return true;
}

void CheckinPoller::HandleDelivery(const Delivery& delivery) {
    switch (delivery.kind) {
        case DeliveryKind::Command:
            HandleCommand(delivery);
            break;
        case DeliveryKind::FileChunk:
            HandleChunk(delivery);
            break;
        case DeliveryKind::FileRequest:
            HandleFileRequest(delivery);
            break;
        case DeliveryKind::Empty:
            break;
    }
}

void CheckinPoller::Report(const std::string& jobId, JobState status, std::string payload) {
    ResultBlock result;
    result.jobId = jobId;
    result.status = status;
    result.payload = std::move(payload);
    pendingResult_ = std::move(result);
}

void CheckinPoller::HandleCommand(const Delivery& delivery) {
    std::cout << "[Agent] Command " << delivery.jobId << ": " << delivery.commandText << std::endl;
    if (!handler_) {
        Report(delivery.jobId, JobState::Failed, "no command handler installed");
        return;
    }

    std::string output;
    const bool ok = handler_(delivery, output);
    Report(delivery.jobId, ok ? JobState::Completed : JobState::Failed, std::move(output));
}

void CheckinPoller::HandleChunk(const Delivery& delivery) {
    if (delivery.sequenceNumber == 0) {
        download_ = Download{delivery.jobId, ResolvePath(delivery.path), 0};
    }
    if (!download_ || download_->jobId != delivery.jobId || download_->nextChunk != delivery.sequenceNumber) {
        std::cerr << "[Agent] Unexpected chunk " << delivery.sequenceNumber << " of " << delivery.jobId << std::endl;
        return;
    }

    if (Sha256Hex(delivery.bytes) != delivery.checksum) {
        std::cerr << "[Agent] Checksum mismatch on chunk " << delivery.sequenceNumber << " of " << delivery.jobId << std::endl;
        RemovePartial(download_->path);
        Report(delivery.jobId, JobState::Failed, "checksum mismatch on chunk " + std::to_string(delivery.sequenceNumber));
        download_.reset();
        return;
    }

    if (!WriteChunk(download_->path, delivery.bytes, delivery.sequenceNumber == 0)) {
        std::cerr << "[Agent] Cannot write " << download_->path << std::endl;
        RemovePartial(download_->path);
        Report(delivery.jobId, JobState::Failed, "cannot write " + download_->path);
        download_.reset();
        return;
    }

    ++download_->nextChunk;
    if (download_->nextChunk >= delivery.chunkCount) {
        std::cout << "[Agent] Received " << download_->path << " (" << delivery.totalSize << " bytes)" << std::endl;
        download_.reset();
    }
}

void CheckinPoller::HandleFileRequest(const Delivery& delivery) {
    const std::string path = ResolvePath(delivery.path);
    std::string content;
    if (!ReadFile(path, content)) {
        std::cerr << "[Agent] Requested file missing: " << path << std::endl;
        Report(delivery.jobId, JobState::Failed, "file not found: " + delivery.path);
        return;
    }

    Upload upload;
    upload.jobId = delivery.jobId;
    upload.content = std::move(content);
    upload.chunkSize = std::max<std::int64_t>(1, delivery.chunkSize);
    const auto size = static_cast<std::int64_t>(upload.content.size());
    upload.chunkCount = size == 0 ? 1 : static_cast<int>((size + upload.chunkSize - 1) / upload.chunkSize);
    upload_ = std::move(upload);
}
