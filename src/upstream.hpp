#pragma once
#include "model.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <functional>
#include <optional>

namespace cordbridge {

enum class UpstreamStatus { Disconnected, Connecting, Connected, AuthFailed };

const char* upstream_status_name(UpstreamStatus status);

// Presence activity kinds accepted by setPresence.
enum class PresenceKind { Playing, Listening, Watching, Competing };

// Case-insensitive; nullopt for anything else.
std::optional<PresenceKind> presence_kind_from_name(const std::string& name);

struct GuildSummary {
    std::string id;
    std::string name;
};

// Result of one upstream call: value on success, error otherwise.
template<typename T>
struct UpstreamResult {
    std::optional<T> value;
    UpstreamError error;

    bool ok() const { return value.has_value(); }

    static UpstreamResult success(T v) {
        UpstreamResult r;
        r.value = std::move(v);
        return r;
    }
    static UpstreamResult failure(ErrorKind kind, std::string message) {
        UpstreamResult r;
        r.error = UpstreamError{kind, std::move(message)};
        return r;
    }
};

struct Unit {};

using GuildsCallback   = std::function<void(UpstreamResult<std::vector<GuildSummary>>)>;
using ChannelsCallback = std::function<void(UpstreamResult<std::vector<Channel>>)>;
using SendCallback     = std::function<void(UpstreamResult<std::string>)>;  // sent message id
using HistoryCallback  = std::function<void(UpstreamResult<std::vector<HistoryEntry>>)>;
using UnitCallback     = std::function<void(UpstreamResult<Unit>)>;

struct UpstreamListener {
    std::function<void(UpstreamStatus)> on_status;
    std::function<void(const UserRef&)> on_identity;
    std::function<void(InboundMessage)> on_message;
};

// The single authenticated connection to the chat platform. Adapters
// normalise every platform-specific code (channel types, error statuses)
// before it crosses this interface. All callbacks fire on the event loop.
class Upstream {
public:
    virtual ~Upstream() = default;

    virtual std::string upstream_name() const = 0;

    virtual void set_listener(UpstreamListener listener) = 0;

    // Start connecting; status changes arrive through the listener.
    virtual void connect() = 0;
    virtual void disconnect() = 0;

    virtual UpstreamStatus status() const = 0;

    // Connected identity; nullopt before the first READY.
    virtual std::optional<UserRef> self_identity() const = 0;

    // Every guild visible to the identity (all pages).
    virtual void list_guilds(GuildsCallback done) = 0;

    // Every channel of one guild, kinds normalised.
    virtual void list_channels(const std::string& guild_id, ChannelsCallback done) = 0;

    virtual void send_message(const std::string& channel_id,
                              const std::string& content,
                              SendCallback done) = 0;

    // Newest-first page of at most `limit` messages older than `before`
    // (empty = latest).
    virtual void fetch_messages(const std::string& channel_id,
                                const std::string& before,
                                uint32_t limit,
                                HistoryCallback done) = 0;

    virtual void set_presence(PresenceKind kind, const std::string& text,
                              UnitCallback done) = 0;

    bool connected() const { return status() == UpstreamStatus::Connected; }
};

} // namespace cordbridge
