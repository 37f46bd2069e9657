#pragma once

#include <otpxx/detail/result.hpp>
#include <otpxx/detail/log.hpp>

#include <otpxx/codec/base64.hpp>
#include <otpxx/codec/encoded_word.hpp>
#include <otpxx/codec/quoted_printable.hpp>

#include <otpxx/mime/message.hpp>

#include <otpxx/net/dialog.hpp>
#include <otpxx/net/tls_mode.hpp>
#include <otpxx/net/tls_options.hpp>
#include <otpxx/net/upgradable_stream.hpp>

#include <otpxx/imap/types.hpp>
#include <otpxx/imap/error_mapping.hpp>
#include <otpxx/imap/client.hpp>

// Connection pooling
#include <otpxx/pool/pool_config.hpp>
#include <otpxx/pool/connection_pool.hpp>

// Fetch engine
#include <otpxx/fetch/types.hpp>
#include <otpxx/fetch/session.hpp>
#include <otpxx/fetch/imap_session.hpp>
#include <otpxx/fetch/message_parser.hpp>
#include <otpxx/fetch/folder_scanner.hpp>
#include <otpxx/fetch/result_cache.hpp>
#include <otpxx/fetch/inflight.hpp>
#include <otpxx/fetch/poller.hpp>
#include <otpxx/fetch/sender_presets.hpp>
#include <otpxx/fetch/fetcher_config.hpp>
#include <otpxx/otp_fetcher.hpp>
