#include "request_response.hpp"
#include "radius_avp.hpp"
#include "net_integer.hpp"

template<>
std::vector<uint8_t> serializeAttributes<CoARequest>( const CoARequest &req ) {
    std::vector<AVP> avp_set {
        AVP { RADIUS_ATTR::USER_NAME, req.username }
    };

    if( !req.session_id.empty() ) {
        avp_set.emplace_back( RADIUS_ATTR::ACCT_SESSION_ID, req.session_id );
    }

    avp_set.emplace_back( RADIUS_ATTR::ACCT_STATUS_TYPE, BE32( COA_ACCT_SENTINEL ) );
    avp_set.emplace_back( RADIUS_ATTR::ACCT_DELAY_TIME, BE32( COA_ACCT_SENTINEL ) );
    avp_set.emplace_back( RADIUS_ATTR::ACCT_INPUT_OCTETS, BE32( COA_ACCT_SENTINEL ) );

    if( !req.rate_limit.empty() ) {
        avp_set.emplace_back( MIKROTIK_VENDOR_ID, MIKROTIK_RATE_LIMIT, req.rate_limit );
    }

    return serializeAVP( avp_set );
}

template<>
std::vector<uint8_t> serializeAttributes<DisconnectRequest>( const DisconnectRequest &req ) {
    std::vector<AVP> avp_set {
        AVP { RADIUS_ATTR::USER_NAME, req.username }
    };

    if( !req.session_id.empty() ) {
        avp_set.emplace_back( RADIUS_ATTR::ACCT_SESSION_ID, req.session_id );
    }

    return serializeAVP( avp_set );
}

template<>
CoAResponse deserializeAttributes<CoAResponse>( const std::vector<uint8_t> &v ) {
    CoAResponse res;

    auto avp_set = parseAVP( v );
    for( auto const &avp: avp_set ) {
        if( avp.vendor != 0 ) {
            continue;
        }
        if( avp.type == static_cast<uint8_t>( RADIUS_ATTR::ERROR_CAUSE ) ) {
            if( auto const &[ cause, success ] = avp.getVal<BE32>(); success ) {
                res.error_cause = cause.native();
            }
        } else if( avp.type == static_cast<uint8_t>( RADIUS_ATTR::REPLY_MESSAGE ) ) {
            res.reply_message = std::get<0>( avp.getVal<std::string>() );
        }
    }
    return res;
}
