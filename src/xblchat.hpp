#pragma once

#include "cache/credential_cache.hpp"
#include "chat/beast_relay_connection.hpp"
#include "chat/chat_stream_client.hpp"
#include "config/app_config.hpp"
#include "msal/msal.hpp"
#include "net/httplib_transport.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"
#include "xbl/credential_pipeline.hpp"
#include "xbl/xsts_exchanger.hpp"
