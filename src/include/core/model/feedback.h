#pragma once

#include "feedback/connecting.h"
#include "feedback/feedback.h"
#include "feedback/feedback_type.h"
#include "feedback/response_received.h"
#include "feedback/transfer_completed.h"
#include "feedback/transfer_failed.h"
#include "feedback/transfer_progress.h"
#include "feedback/transfer_started.h"
#include <functional>

namespace upbeam::core {

using FeedbackCallback = std::function<void(const Feedback& feedback)>;

} // namespace upbeam::core
