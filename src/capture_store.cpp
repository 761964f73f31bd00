#include "cmdprove.h"
#include "utils.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace cmdprove {

namespace {

std::filesystem::path candidatePath(const std::filesystem::path& dir, const std::string& baseName, int index,
                                    Channel channel) {
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "%02d", index);
    return dir / (baseName + suffix + channelExtension(channel));
}

// Creates the file only if it does not exist yet.
bool reserve(const std::filesystem::path& path) {
    const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd == -1) {
        if (errno == EEXIST) {
            return false;
        }
        throw TestError("Cannot create capture file '" + path.string() + "': " + std::strerror(errno));
    }
    close(fd);
    return true;
}

} // namespace

const std::filesystem::path& CapturePaths::of(Channel channel) const {
    switch (channel) {
        case Channel::Out: return out;
        case Channel::Err: return err;
        case Channel::Ret: return ret;
    }
    return out;
}

CaptureStore::CaptureStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

CapturePaths CaptureStore::allocate(const std::string& baseName) {
    for (int index = 0; index < kMaxCandidates; ++index) {
        CapturePaths paths{candidatePath(directory_, baseName, index, Channel::Out),
                           candidatePath(directory_, baseName, index, Channel::Err),
                           candidatePath(directory_, baseName, index, Channel::Ret)};

        std::error_code ec;
        bool taken = false;
        for (const Channel channel : kChannels) {
            if (std::filesystem::exists(paths.of(channel), ec)) {
                taken = true;
                break;
            }
        }
        if (taken) {
            continue;
        }

        std::vector<std::filesystem::path> created;
        for (const Channel channel : kChannels) {
            if (!reserve(paths.of(channel))) {
                taken = true;
                break;
            }
            created.push_back(paths.of(channel));
        }
        if (taken) {
            for (const auto& path : created) {
                std::filesystem::remove(path, ec);
            }
            continue;
        }
        return paths;
    }

    throw TestError("Could not determine a unique file name for '" + (directory_ / baseName).string() + "' after " +
                    std::to_string(kMaxCandidates) + " attempts.");
}

const std::filesystem::path& CaptureStore::directory() const {
    return directory_;
}

} // namespace cmdprove
