#ifndef ACPBRIDGE_HPP
#define ACPBRIDGE_HPP

// Main header that includes everything

#include <acpbridge/agent.hpp>
#include <acpbridge/config.hpp>
#include <acpbridge/connection.hpp>
#include <acpbridge/context_queue.hpp>
#include <acpbridge/errors.hpp>
#include <acpbridge/logging.hpp>
#include <acpbridge/message_context.hpp>
#include <acpbridge/message_processor.hpp>
#include <acpbridge/message_queue.hpp>
#include <acpbridge/runtime.hpp>
#include <acpbridge/types.hpp>
#include <acpbridge/version.hpp>

// Delivery helpers: markdown-aware chunking and streaming senders
#include <acpbridge/delivery/live_preview.hpp>
#include <acpbridge/delivery/markdown.hpp>
#include <acpbridge/delivery/streaming_sender.hpp>

#endif // ACPBRIDGE_HPP
