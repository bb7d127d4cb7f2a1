/**
 * @file wql.hpp
 * @brief Decoding of remote management queries and events into C++ records
 *
 * Include this header to get everything: the object model, the decoder, result
 * collections, sessions and event subscriptions.
 */

#pragma once

#include "wql_channel.hpp"
#include "wql_collection.hpp"
#include "wql_connection.hpp"
#include "wql_decoder.hpp"
#include "wql_error.hpp"
#include "wql_field.hpp"
#include "wql_services.hpp"
#include "wql_subscription.hpp"
#include "wql_timestamp.hpp"
#include "wql_variant.hpp"
