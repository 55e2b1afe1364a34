#include "sdp/sdp_senders.hpp"
#include "sdp/sdp_utils.hpp"

#include <map>
#include <stdexcept>
#include <tuple>

namespace jinglesdp {
namespace sdp {
namespace {

using SendersKey = std::tuple<SessionRole, NegotiationDirection, Senders>;
using SendersTable = std::map<SendersKey, Senders>;

const SendersTable& senders_table() {
    using R = SessionRole;
    using D = NegotiationDirection;
    using S = Senders;
    static const SendersTable table = {
        // initiator, incoming
        {{R::INITIATOR, D::INCOMING, S::INITIATOR}, S::RECV_ONLY},
        {{R::INITIATOR, D::INCOMING, S::RESPONDER}, S::SEND_ONLY},
        {{R::INITIATOR, D::INCOMING, S::BOTH}, S::SEND_RECV},
        {{R::INITIATOR, D::INCOMING, S::NONE}, S::INACTIVE},
        {{R::INITIATOR, D::INCOMING, S::RECV_ONLY}, S::INITIATOR},
        {{R::INITIATOR, D::INCOMING, S::SEND_ONLY}, S::RESPONDER},
        {{R::INITIATOR, D::INCOMING, S::SEND_RECV}, S::BOTH},
        {{R::INITIATOR, D::INCOMING, S::INACTIVE}, S::NONE},
        // initiator, outgoing
        {{R::INITIATOR, D::OUTGOING, S::INITIATOR}, S::SEND_ONLY},
        {{R::INITIATOR, D::OUTGOING, S::RESPONDER}, S::RECV_ONLY},
        {{R::INITIATOR, D::OUTGOING, S::BOTH}, S::SEND_RECV},
        {{R::INITIATOR, D::OUTGOING, S::NONE}, S::INACTIVE},
        {{R::INITIATOR, D::OUTGOING, S::RECV_ONLY}, S::RESPONDER},
        {{R::INITIATOR, D::OUTGOING, S::SEND_ONLY}, S::INITIATOR},
        {{R::INITIATOR, D::OUTGOING, S::SEND_RECV}, S::BOTH},
        {{R::INITIATOR, D::OUTGOING, S::INACTIVE}, S::NONE},
        // responder, incoming
        {{R::RESPONDER, D::INCOMING, S::INITIATOR}, S::SEND_ONLY},
        {{R::RESPONDER, D::INCOMING, S::RESPONDER}, S::RECV_ONLY},
        {{R::RESPONDER, D::INCOMING, S::BOTH}, S::SEND_RECV},
        {{R::RESPONDER, D::INCOMING, S::NONE}, S::INACTIVE},
        {{R::RESPONDER, D::INCOMING, S::RECV_ONLY}, S::RESPONDER},
        {{R::RESPONDER, D::INCOMING, S::SEND_ONLY}, S::INITIATOR},
        {{R::RESPONDER, D::INCOMING, S::SEND_RECV}, S::BOTH},
        {{R::RESPONDER, D::INCOMING, S::INACTIVE}, S::NONE},
        // responder, outgoing
        {{R::RESPONDER, D::OUTGOING, S::INITIATOR}, S::RECV_ONLY},
        {{R::RESPONDER, D::OUTGOING, S::RESPONDER}, S::SEND_ONLY},
        {{R::RESPONDER, D::OUTGOING, S::BOTH}, S::SEND_RECV},
        {{R::RESPONDER, D::OUTGOING, S::NONE}, S::INACTIVE},
        {{R::RESPONDER, D::OUTGOING, S::RECV_ONLY}, S::INITIATOR},
        {{R::RESPONDER, D::OUTGOING, S::SEND_ONLY}, S::RESPONDER},
        {{R::RESPONDER, D::OUTGOING, S::SEND_RECV}, S::BOTH},
        {{R::RESPONDER, D::OUTGOING, S::INACTIVE}, S::NONE},
    };
    return table;
}

} // namespace

Senders ResolveSenders(SessionRole role, NegotiationDirection direction, Senders declared) {
    const auto& table = senders_table();
    auto it = table.find(std::make_tuple(role, direction, declared));
    if (it == table.end()) {
        throw std::logic_error("No senders mapping for role=" + ToString(role) +
                               ", direction=" + ToString(direction) +
                               ", senders=" + ToString(declared));
    }
    return it->second;
}

} // namespace sdp
} // namespace jinglesdp
