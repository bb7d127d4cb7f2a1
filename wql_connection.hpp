/**
 * @file wql_connection.hpp
 * @brief Sessions that run queries straight into records
 *
 * @code
 * Client client(std::make_shared<MyLocator>());
 *
 * std::vector<Process> processes;
 * if (auto status = client.query("SELECT * FROM Win32_Process", processes); ! status)
 *     std::cerr << status.error() << std::endl;
 *
 * auto connection = client.connect({ .nameSpace = "root\\standardcimv2" });
 * @endcode
 */

#pragma once

#include <memory>
#include <mutex>
#include <string_view>
#include <vector>
#include "wql_collection.hpp"
#include "wql_decoder.hpp"
#include "wql_error.hpp"
#include "wql_services.hpp"

namespace wql
{

/**
 * @brief An open session paired with the decoder used for its results
 *
 * All calls are serialised. Reference fields of decoded records are resolved
 * through this connection unless the decoder already has a resolver.
 */
class Connection
{
public:
    Connection(std::unique_ptr<Services> services_, Decoder decoder_ = {});

    /// Closes the session if it is still open
    ~Connection();

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;

    /**
     * @brief Runs query and decodes its results into dst
     *
     * See decodeAll() for how partially decoded elements are reported.
     */
    template <typename Element>
    Status query(std::string_view text, std::vector<Element>& dst);

    /// Fetches the object at path and decodes it into dst
    template <typename T>
    Status get(std::string_view path, T& dst);

    /// Fetches the object at path
    Result<ObjectPtr> getObject(std::string_view path);

    /// Releases the session. Closing a closed connection succeeds.
    Status close();

    bool isOpen() const;

    /**
     * @brief The decoder configuration of this connection
     *
     * The copy does not carry the resolver that fetches references through
     * this connection, so it stays usable after the connection is gone. A
     * resolver supplied by the caller is kept.
     */
    Decoder decoder() const;

private:
    Status checkOpen() const;

    mutable std::recursive_mutex lock;
    std::unique_ptr<Services> services;
    Decoder recordDecoder;
    bool resolvesThroughConnection = false;
};

/**
 * @brief Entry point: opens connections with a shared decoder configuration
 */
class Client
{
public:
    explicit Client(std::shared_ptr<Locator> locator_, Decoder decoder_ = {});

    /// Decoder configuration handed to every connection
    Decoder decoder;

    /// Opens a new session
    Result<std::unique_ptr<Connection>> connect(ConnectOptions const& options = {});

    /**
     * @brief Connects, runs query and closes the session again
     *
     * A failure to close is reported together with the query's own result.
     */
    template <typename Element>
    Status query(std::string_view text, std::vector<Element>& dst, ConnectOptions const& options = {});

private:
    std::shared_ptr<Locator> locator;
};

} // namespace wql

// Include template implementations
#include "wql_connection.tpp"
