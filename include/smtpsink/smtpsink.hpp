#pragma once

#include <smtpsink/config.hpp>

#include <smtpsink/detail/log.hpp>
#include <smtpsink/detail/result.hpp>
#include <smtpsink/detail/asio_error.hpp>

#include <smtpsink/net/line_channel.hpp>

#include <smtpsink/smtp/types.hpp>
#include <smtpsink/smtp/parser.hpp>
#include <smtpsink/smtp/commands.hpp>
#include <smtpsink/smtp/session.hpp>
#include <smtpsink/smtp/server.hpp>
