#include "ObjectInfo.hpp"

#include <iomanip>
#include <sstream>
#include <string>

#include <sys/stat.h>

#include <google/protobuf/util/time_util.h>
#include <google/protobuf/timestamp.pb.h>

namespace {
    google::protobuf::Timestamp TimespecToTimestamp(const struct timespec& ts)
    {
        google::protobuf::Timestamp out;

        out.set_seconds(ts.tv_sec);
        out.set_nanos(static_cast<int32_t>(ts.tv_nsec));

        return out;
    }

    std::optional<struct stat> StatPath(const std::filesystem::path& path) noexcept
    {
        struct stat st;

        if (stat(path.c_str(), &st) != 0)
            return std::nullopt;

        return st;
    }
}

ObjectInfo MakeObjectInfo(std::string bucket, std::string name)
{
    ObjectInfo info;

    info.set_bucket(std::move(bucket));
    info.set_name(std::move(name));

    return info;
}

ObjectInfo MakeObjectInfoFrom(const std::filesystem::path& from, const ObjectInfo& requested)
{
    ObjectInfo info;

    info.set_bucket(requested.bucket());
    info.set_name(requested.name());
    info.set_content_type(requested.content_type());
    *info.mutable_metadata() = requested.metadata();

    const auto st = StatPath(from);
    if (!st)
        return info;

    info.set_size(static_cast<uint64_t>(st->st_size));
    info.set_generation(GenerationOf(from).value_or(0));

    // No birth time in struct stat; ctime is the closest the filesystem keeps.
    info.mutable_create_time()->CopyFrom(TimespecToTimestamp(st->st_ctim));
    info.mutable_update_time()->CopyFrom(TimespecToTimestamp(st->st_mtim));

    return info;
}

std::optional<int64_t> GenerationOf(const std::filesystem::path& path) noexcept
{
    const auto st = StatPath(path);
    if (!st || !S_ISREG(st->st_mode))
        return std::nullopt;

    return static_cast<int64_t>(st->st_mtim.tv_sec) * 1000000
         + static_cast<int64_t>(st->st_mtim.tv_nsec) / 1000;
}

std::string ObjectName(const ObjectInfo& info)
{
    return info.bucket() + "/" + info.name();
}

std::string ObjectInfoToString(const ObjectInfo& info)
{
    using google::protobuf::util::TimeUtil;

    std::stringstream ss;

    ss << "object: " << ObjectName(info) << std::endl;
    if (info.has_size())
        ss << "size: " << info.size() << std::endl;
    ss << "generation: " << info.generation() << std::endl;
    if (!info.content_type().empty())
        ss << "content-type: " << info.content_type() << std::endl;
    for (const auto& [key, value] : info.metadata())
        ss << "metadata: " << key << "=" << value << std::endl;

    if (!info.hash().data().empty()) {
        ss << "hash: " << std::hex << std::setfill('0');
        for (unsigned char byte : info.hash().data())
            ss << std::setw(2) << static_cast<int>(byte);
        ss << std::dec << std::endl;
    }

    if (info.has_create_time())
        ss << "ctime: " << TimeUtil::ToString(info.create_time()) << std::endl;
    if (info.has_update_time())
        ss << "mtime: " << TimeUtil::ToString(info.update_time()) << std::endl;

    return ss.str();
}
