#include "main/PlayerControl.hh"

#include <cassert>
#include <map>

namespace Clue {
namespace Main {

using Messaging::Identity;

namespace {

bool isSameClient(const Identity& owner, const Identity& client)
{
    if (!owner.userId.empty() || !client.userId.empty()) {
        return owner.userId == client.userId;
    }
    return owner.routingId == client.routingId;
}

}

class PlayerControl::Impl {
public:

    bool isAvailable(const Identity& client, const Uuid& player) const;
    bool claimPlayer(const Identity& client, const Uuid& player);
    bool isControlledBy(const Identity& client, const Uuid& player) const;

private:

    std::map<Uuid, Identity> owners;
};

bool PlayerControl::Impl::isAvailable(
    const Identity& client, const Uuid& player) const
{
    const auto iter = owners.find(player);
    return iter == owners.end() || isSameClient(iter->second, client);
}

bool PlayerControl::Impl::claimPlayer(
    const Identity& client, const Uuid& player)
{
    const auto [iter, inserted] = owners.try_emplace(player, client);
    return inserted || isSameClient(iter->second, client);
}

bool PlayerControl::Impl::isControlledBy(
    const Identity& client, const Uuid& player) const
{
    const auto iter = owners.find(player);
    return iter != owners.end() && isSameClient(iter->second, client);
}

PlayerControl::PlayerControl() :
    impl {std::make_unique<Impl>()}
{
}

PlayerControl::~PlayerControl() = default;

bool PlayerControl::isAvailable(
    const Identity& client, const Uuid& player) const
{
    assert(impl);
    return impl->isAvailable(client, player);
}

bool PlayerControl::claimPlayer(const Identity& client, const Uuid& player)
{
    assert(impl);
    return impl->claimPlayer(client, player);
}

bool PlayerControl::isControlledBy(
    const Identity& client, const Uuid& player) const
{
    assert(impl);
    return impl->isControlledBy(client, player);
}

}
}
