#pragma once
#include "model.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "upstream.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace cordbridge {

struct DirectoryOptions {
    uint32_t batch_size = 5;
    uint32_t batch_pause_ms = 120;
};

struct ResolvedTarget {
    std::string guild_id;
    std::string guild_name;
    std::string channel_id;
    std::string channel_name;
};

// Holds the guild/channel tree and rebuilds it from the upstream on demand.
//
// A build visits every guild in batches, keeping only sendable channels.
// Results accumulate in a staging list; the committed snapshot is replaced
// once every guild has been visited. `ready` is false for the whole build
// and becomes true exactly once, at the end.
//
// Events published: DirectoryBuildStartedEvent, GuildCachedEvent (progressive
// builds only, one per guild), DirectoryBuiltEvent.
class DirectoryCache {
public:
    DirectoryCache(EventLoop& loop, EventBus& bus, Upstream& upstream,
                   DirectoryOptions options = {});

    // Install a persisted snapshot (startup only).
    void restore(std::vector<Guild> servers, bool ready);

    // Start a build. Returns false if one is already in flight.
    bool build(bool progressive);

    bool building() const { return building_; }
    bool ready() const { return ready_; }
    bool empty() const { return servers_.empty(); }

    const std::vector<Guild>& servers() const { return servers_; }

    // Each half may be given as an id or a name in either field. Ids win over
    // names; names compare case-insensitively; only sendable channels match.
    // Without a guild the channel is looked up by id across every guild.
    // Falls back to guilds already visited by a running build.
    std::optional<ResolvedTarget> resolve(const SendTarget& target) const;

    // Channels of one guild by id or name (sendable only); nullopt if unknown.
    std::optional<Guild> find_guild(const std::string& guild_id,
                                    const std::string& guild_name) const;

private:
    // Committed guilds, then the ones staged by a running build.
    std::vector<const Guild*> candidates() const;

    void on_guilds_listed(UpstreamResult<std::vector<GuildSummary>> result);
    void fetch_next_batch();
    void on_channels(size_t slot, UpstreamResult<std::vector<Channel>> result);
    void finish_build();

    EventLoop& loop_;
    EventBus& bus_;
    Upstream& upstream_;
    DirectoryOptions options_;

    std::vector<Guild> servers_;
    bool ready_ = false;

    // Build state
    bool building_ = false;
    bool progressive_ = false;
    std::vector<GuildSummary> pending_guilds_;
    std::vector<std::optional<Guild>> staging_;
    size_t next_index_ = 0;
    size_t outstanding_ = 0;
    uint64_t started_at_ = 0;
};

} // namespace cordbridge
