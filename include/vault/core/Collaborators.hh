#pragma once

#include "vault/core/PlayerPose.hh"
#include "vault/core/Snapshot.hh"
#include "vault/utils/Utils.hh"

#include <string>

namespace vault {

// Draws one frame. Called once per tick whatever the session state.
class RenderBackend {
  public:
    virtual ~RenderBackend() = default;
    virtual void renderFrame(const GameSnapshot& snapshot, const PlayerPose& pose) = 0;
};

// Opaque session/user id, shown to the player and never branched on
class IdentityProvider {
  public:
    virtual ~IdentityProvider() = default;
    virtual std::string sessionId() const = 0;
};

// Fallback when the host supplies no identity
class LocalIdentityProvider : public IdentityProvider {
  public:
    LocalIdentityProvider() : id_(makeHexId("local_")) {}

    std::string sessionId() const override { return id_; }

  private:
    std::string id_;
};

} // namespace vault
