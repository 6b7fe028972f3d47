#include "directory_cache.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace cordbridge {

static std::vector<Channel> sendable_only(std::vector<Channel> channels) {
    channels.erase(std::remove_if(channels.begin(), channels.end(),
                                  [](const Channel& ch) { return !is_sendable(ch.kind); }),
                   channels.end());
    return channels;
}

// Either field may carry an id or a name. An id match on either field wins
// over a case-insensitive name match on either field.
static bool id_matches(const std::string& id, const std::string& a, const std::string& b) {
    return (!a.empty() && id == a) || (!b.empty() && id == b);
}

static bool name_matches(const std::string& name, const std::string& a, const std::string& b) {
    return (!a.empty() && iequals(name, a)) || (!b.empty() && iequals(name, b));
}

static const Guild* match_guild(const std::vector<const Guild*>& guilds,
                                const std::string& guild_id,
                                const std::string& guild_name) {
    for (const auto* g : guilds) {
        if (id_matches(g->id, guild_id, guild_name)) return g;
    }
    for (const auto* g : guilds) {
        if (name_matches(g->name, guild_id, guild_name)) return g;
    }
    return nullptr;
}

static const Channel* match_channel(const Guild& guild,
                                    const std::string& channel_id,
                                    const std::string& channel_name,
                                    bool ids_only = false) {
    for (const auto& ch : guild.channels) {
        if (is_sendable(ch.kind) && id_matches(ch.id, channel_id, channel_name)) return &ch;
    }
    if (ids_only) return nullptr;
    for (const auto& ch : guild.channels) {
        if (is_sendable(ch.kind) && name_matches(ch.name, channel_id, channel_name)) return &ch;
    }
    return nullptr;
}

DirectoryCache::DirectoryCache(EventLoop& loop, EventBus& bus, Upstream& upstream,
                               DirectoryOptions options)
    : loop_(loop), bus_(bus), upstream_(upstream), options_(options)
{
    if (options_.batch_size == 0) options_.batch_size = 1;
}

void DirectoryCache::restore(std::vector<Guild> servers, bool ready) {
    servers_ = std::move(servers);
    ready_ = ready;
}

bool DirectoryCache::build(bool progressive) {
    if (building_) {
        std::cerr << "[directory] Build already in progress, ignoring trigger\n";
        return false;
    }
    building_ = true;
    progressive_ = progressive;
    ready_ = false;
    pending_guilds_.clear();
    staging_.clear();
    next_index_ = 0;
    outstanding_ = 0;
    started_at_ = loop_.now_ms();

    std::cerr << "[directory] Build started (progressive="
              << (progressive ? "yes" : "no") << ")\n";
    DirectoryBuildStartedEvent started;
    bus_.publish(started);

    upstream_.list_guilds([this](UpstreamResult<std::vector<GuildSummary>> result) {
        on_guilds_listed(std::move(result));
    });
    return true;
}

void DirectoryCache::on_guilds_listed(UpstreamResult<std::vector<GuildSummary>> result) {
    if (!result.ok()) {
        // Nothing visited: keep the committed snapshot as the build result.
        std::cerr << "[directory] Guild listing failed: " << result.error.message
                  << "; keeping " << servers_.size() << " cached servers\n";
        for (const auto& g : servers_) {
            staging_.emplace_back(g);
        }
        finish_build();
        return;
    }

    pending_guilds_ = std::move(*result.value);
    staging_.assign(pending_guilds_.size(), std::nullopt);
    std::cerr << "[directory] Visiting " << pending_guilds_.size() << " guilds\n";
    fetch_next_batch();
}

void DirectoryCache::fetch_next_batch() {
    if (next_index_ >= pending_guilds_.size()) {
        finish_build();
        return;
    }

    size_t end = std::min(pending_guilds_.size(),
                          next_index_ + static_cast<size_t>(options_.batch_size));
    size_t begin = next_index_;
    next_index_ = end;
    outstanding_ = end - begin;

    for (size_t slot = begin; slot < end; ++slot) {
        upstream_.list_channels(pending_guilds_[slot].id,
            [this, slot](UpstreamResult<std::vector<Channel>> result) {
                on_channels(slot, std::move(result));
            });
    }
}

void DirectoryCache::on_channels(size_t slot, UpstreamResult<std::vector<Channel>> result) {
    if (slot >= staging_.size()) return;

    Guild guild;
    guild.id = pending_guilds_[slot].id;
    guild.name = pending_guilds_[slot].name;
    if (result.ok()) {
        guild.channels = sendable_only(std::move(*result.value));
    } else {
        std::cerr << "[directory] Channels of guild " << guild.id << " unavailable: "
                  << result.error.message << "\n";
    }
    staging_[slot] = guild;

    if (progressive_) {
        GuildCachedEvent cached;
        cached.guild = std::move(guild);
        bus_.publish(cached);
    }

    if (outstanding_ > 0) --outstanding_;
    if (outstanding_ > 0) return;

    if (next_index_ >= pending_guilds_.size()) {
        finish_build();
    } else {
        loop_.schedule(std::chrono::milliseconds(options_.batch_pause_ms),
                       [this]() { fetch_next_batch(); });
    }
}

void DirectoryCache::finish_build() {
    std::vector<Guild> built;
    built.reserve(staging_.size());
    for (auto& slot : staging_) {
        if (slot) built.push_back(std::move(*slot));
    }
    servers_ = std::move(built);
    staging_.clear();
    pending_guilds_.clear();
    ready_ = true;
    building_ = false;

    std::cerr << "[directory] Build finished: " << servers_.size() << " servers in "
              << (loop_.now_ms() - started_at_) << "ms\n";

    DirectoryBuiltEvent done;
    done.servers = servers_;
    bus_.publish(done);
}

std::vector<const Guild*> DirectoryCache::candidates() const {
    std::vector<const Guild*> out;
    out.reserve(servers_.size() + staging_.size());
    for (const auto& g : servers_) out.push_back(&g);
    if (building_) {
        for (const auto& slot : staging_) {
            if (slot) out.push_back(&*slot);
        }
    }
    return out;
}

std::optional<Guild> DirectoryCache::find_guild(const std::string& guild_id,
                                                const std::string& guild_name) const {
    std::vector<const Guild*> committed;
    committed.reserve(servers_.size());
    for (const auto& g : servers_) committed.push_back(&g);

    const Guild* g = match_guild(committed, guild_id, guild_name);
    if (!g && building_) g = match_guild(candidates(), guild_id, guild_name);
    if (!g) return std::nullopt;

    Guild out;
    out.id = g->id;
    out.name = g->name;
    for (const auto& ch : g->channels) {
        if (is_sendable(ch.kind)) out.channels.push_back(ch);
    }
    return out;
}

std::optional<ResolvedTarget> DirectoryCache::resolve(const SendTarget& target) const {
    const Guild* guild = nullptr;
    const Channel* ch = nullptr;

    if (target.guild_id.empty() && target.guild_name.empty()) {
        // No guild given: channel ids are unique across guilds, names are not.
        for (const auto* g : candidates()) {
            ch = match_channel(*g, target.channel_id, target.channel_name, true);
            if (ch) {
                guild = g;
                break;
            }
        }
    } else {
        std::vector<const Guild*> committed;
        for (const auto& g : servers_) committed.push_back(&g);
        guild = match_guild(committed, target.guild_id, target.guild_name);
        if (!guild && building_) guild = match_guild(candidates(), target.guild_id, target.guild_name);
        if (guild) ch = match_channel(*guild, target.channel_id, target.channel_name);
    }
    if (!guild || !ch) return std::nullopt;

    ResolvedTarget r;
    r.guild_id = guild->id;
    r.guild_name = guild->name;
    r.channel_id = ch->id;
    r.channel_name = ch->name;
    return r;
}

} // namespace cordbridge
