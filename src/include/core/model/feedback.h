#pragma once

#include "feedback/feedback_type.h"
#include "feedback/upload_finished.h"
#include "feedback/upload_retrying.h"
#include "feedback/upload_started.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace reup::core {

struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

using FeedbackCallback = std::function<void(Feedback&&)>;

} // namespace reup::core
