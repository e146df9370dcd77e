#pragma once

#include "model/feedback.h"
#include "model/transfer_outcome.h"
#include "model/upload_request.h"
#include "model/upload_state.h"
