#pragma once

#include <ids/id.hpp>

DEFINE_ID_TYPE(ChannelId)
DEFINE_ID_TYPE(OperationId)
