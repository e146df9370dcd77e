#pragma once

#include <nlohmann/json.hpp>

namespace reup::core {

enum class FeedbackType {
    kUploadStarted,  // 上传开始（文件名、大小、upload_id）
    kUploadRetrying, // 传输中断，准备重连（第几次尝试、原因、等待时长）
    kUploadFinished, // 上传结束（最终结果）
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kUploadStarted, "UploadStarted"},
                                 {FeedbackType::kUploadRetrying, "UploadRetrying"},
                                 {FeedbackType::kUploadFinished, "UploadFinished"},
                             });

} // namespace reup::core
