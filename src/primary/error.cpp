// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "error.hpp"

#include "util/common/variant_overloaded.hpp"

namespace dagpool::primary {
    auto to_string(const error& err) -> std::string {
        return std::visit(
            overloaded{
                [](const header_too_old& e) -> std::string {
                    return "Header " + dagpool::to_string(e.m_id)
                         + " from round " + std::to_string(e.m_round)
                         + " is too old";
                },
                [](const vote_too_old& e) -> std::string {
                    return "Vote for header " + dagpool::to_string(e.m_id)
                         + " from round " + std::to_string(e.m_round)
                         + " is too old";
                },
                [](const certificate_too_old& e) -> std::string {
                    return "Certificate " + dagpool::to_string(e.m_digest)
                         + " from round " + std::to_string(e.m_round)
                         + " is too old";
                },
                [](const authority_reuse& e) -> std::string {
                    return "Authority " + dagpool::to_string(e.m_authority)
                         + " appears in quorum more than once";
                },
                [](const unexpected_vote& e) -> std::string {
                    return "Received unexpected vote for header "
                         + dagpool::to_string(e.m_id);
                },
                [](const unknown_authority& e) -> std::string {
                    return "Authority " + dagpool::to_string(e.m_authority)
                         + " is not in the committee";
                },
                [](const invalid_header_id& e) -> std::string {
                    return "Header ID " + dagpool::to_string(e.m_id)
                         + " does not match the header contents";
                },
                [](const invalid_signature& e) -> std::string {
                    return "Invalid signature over "
                         + dagpool::to_string(e.m_digest);
                },
                [](const invalid_certificate& e) -> std::string {
                    return "Certificate " + dagpool::to_string(e.m_digest)
                         + " does not carry a valid quorum";
                },
                [](const store_error& e) -> std::string {
                    return "Storage failure: " + e.m_what;
                }},
            err);
    }
}
