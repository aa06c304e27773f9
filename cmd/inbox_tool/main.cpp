// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <inbox/bridge/bridge.hpp>
#include <inbox/bridge/messages.hpp>
#include <inbox/contract/state.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/byte_string.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/config.hpp>
#include <inbox/core/fmt/hex_fmt.hpp>
#include <inbox/core/fmt/int_fmt.hpp>
#include <inbox/core/likely.h>
#include <inbox/core/log_level_map.hpp>
#include <inbox/sequencer/batch_header.hpp>
#include <inbox/sequencer/chain/chain.hpp>
#include <inbox/sequencer/chain/chain_config.h>
#include <inbox/sequencer/delay_proof.hpp>
#include <inbox/sequencer/inbox_config.hpp>
#include <inbox/sequencer/rollup_owner.hpp>
#include <inbox/sequencer/sequencer_inbox.hpp>

#include <CLI/CLI.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

INBOX_ANONYMOUS_NAMESPACE_BEGIN

constexpr auto BRIDGE{0x00000000000000000000000000000000000b51d6_address};
constexpr auto ROLLUP{0x0000000000000000000000000000000000001001_address};
constexpr auto DELAYED_INBOX{
    0x0000000000000000000000000000000000001002_address};
constexpr auto SEQUENCER_INBOX{
    0x0000000000000000000000000000000000001003_address};
constexpr auto OWNER{0x00000000000000000000000000000000000a11ce_address};
constexpr auto POSTER{0x0000000000000000000000000000000000000b0b_address};
constexpr auto USER{0x00000000000000000000000000000000deadbeef_address};

class FixedRollupOwner final : public IRollupOwner
{
public:
    Address owner(Address const &) const override
    {
        return OWNER;
    }
};

struct Submission
{
    bytes32_t data_hash;
    bytes32_t acc;
    BatchHeader header;
};

// Replays one batch against a fresh ledger: `delayed` messages are delivered
// `age` blocks before the batch, then the poster submits a batch reading all
// of them.
Result<Submission> simulate(
    InboxConfig const &config, evmc_tx_context const &ctx,
    uint64_t const delayed, uint64_t const age, byte_string_view const data,
    std::vector<bytes32_t> const &blob_hashes)
{
    State state;
    Bridge bridge{state, BRIDGE, ROLLUP};
    bridge.set_delayed_inbox(DELAYED_INBOX);
    bridge.set_sequencer_inbox(SEQUENCER_INBOX);
    FixedRollupOwner const rollup_owner;
    SequencerInbox inbox{state, bridge, rollup_owner, SEQUENCER_INBOX, config};

    BOOST_OUTCOME_TRY(inbox.initialize(ctx));
    BOOST_OUTCOME_TRY(inbox.set_is_batch_poster(OWNER, POSTER, true));

    evmc_tx_context at = ctx;
    uint64_t const block_number = static_cast<uint64_t>(ctx.block_number);
    uint64_t const timestamp = static_cast<uint64_t>(ctx.block_timestamp);
    at.block_number = static_cast<int64_t>(
        block_number > age ? block_number - age : 0);
    at.block_timestamp = static_cast<int64_t>(
        timestamp > age * 12 ? timestamp - age * 12 : 0);

    std::optional<DelayProof> proof;
    for (uint64_t i = 0; i < delayed; ++i) {
        bytes32_t const message_data_hash{i + 1};
        BOOST_OUTCOME_TRY(
            auto const index,
            bridge.enqueue_delayed_message(
                MessageKind::L2Message, USER, message_data_hash, at));
        if (index == 0) {
            proof = DelayProof{
                .before_delayed_acc = bytes32_t{},
                .delayed_message = DelayedMessage{
                    .kind = MessageKind::L2Message,
                    .sender = USER,
                    .block_number = static_cast<uint64_t>(at.block_number),
                    .timestamp = static_cast<uint64_t>(at.block_timestamp),
                    .inbox_seq_num = index,
                    .base_fee_l1 = intx::be::load<uint256_t>(at.block_base_fee),
                    .message_data_hash = message_data_hash}};
        }
    }

    evmc_tx_context batch_ctx = ctx;
    batch_ctx.tx_origin = POSTER;
    std::vector<evmc_bytes32> blobs(blob_hashes.begin(), blob_hashes.end());
    batch_ctx.blob_hashes = blobs.data();
    batch_ctx.blob_hashes_count = blobs.size();

    TimeBounds const bounds = time_bounds(
        inbox.max_time_variation_for(POSTER, batch_ctx),
        block_number,
        timestamp);
    bool const needs_proof =
        inbox.is_delay_proof_required(POSTER, delayed, batch_ctx);
    if (needs_proof) {
        LOG_INFO("delay buffer active, submitting with a delay proof");
    }

    if (blobs.empty()) {
        BOOST_OUTCOME_TRY(
            needs_proof
                ? inbox.add_sequencer_l2_batch_from_origin_delay_proof(
                      POSTER, 0, data, delayed, 0, 1, *proof, batch_ctx)
                : inbox.add_sequencer_l2_batch_from_origin(
                      POSTER, 0, data, delayed, 0, 1, batch_ctx));
    }
    else {
        BOOST_OUTCOME_TRY(
            needs_proof
                ? inbox.add_sequencer_l2_batch_from_blobs_delay_proof(
                      POSTER, 0, delayed, 0, 1, *proof, batch_ctx)
                : inbox.add_sequencer_l2_batch_from_blobs(
                      POSTER, 0, delayed, 0, 1, batch_ctx));
    }

    BatchHeader const header = encode_header(bounds, delayed);
    Submission res{.header = header};
    res.data_hash = blobs.empty()
                        ? (data.empty() ? empty_hash(header)
                                        : calldata_hash(header, data))
                        : blob_hash(header, blob_hashes);
    BOOST_OUTCOME_TRY(res.acc, inbox.inbox_accs(0));

    LOG_DEBUG(
        "{} delayed messages delivered, {} log entries emitted",
        bridge.delayed_message_count(),
        state.logs().size());
    return res;
}

INBOX_ANONYMOUS_NAMESPACE_END

using namespace inbox;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"inbox_tool"};
    cli.option_defaults()->always_capture_default();

    inbox_chain_config chain_config;
    uint64_t block_number = 1'000'000;
    uint64_t timestamp = 1'700'000'000;
    uint64_t delayed = 0;
    uint64_t age = 0;
    std::string data_hex;
    std::vector<std::string> blob_hash_hex;
    std::optional<uint64_t> max_data_size;
    std::optional<uint64_t> delay_blocks;
    std::optional<uint64_t> future_blocks;
    std::optional<uint64_t> delay_seconds;
    std::optional<uint64_t> future_seconds;
    bool fee_token = false;
    auto log_level = quill::LogLevel::Info;

    std::unordered_map<std::string, inbox_chain_config> const CHAIN_CONFIG_MAP =
        {{"strict", CHAIN_CONFIG_STRICT},
         {"nova", CHAIN_CONFIG_NOVA},
         {"devnet", CHAIN_CONFIG_DEVNET}};

    cli.add_option("--chain", chain_config, "select which chain config to use")
        ->transform(CLI::CheckedTransformer(CHAIN_CONFIG_MAP, CLI::ignore_case))
        ->required();
    cli.add_option("--block", block_number, "host chain block number");
    cli.add_option("--timestamp", timestamp, "host chain block timestamp");
    cli.add_option(
        "--delayed",
        delayed,
        "number of delayed messages delivered before the batch, all of "
        "which the batch reads");
    cli.add_option(
        "--age", age, "blocks between delayed delivery and the batch");
    cli.add_option("--data", data_hex, "batch data as hex");
    cli.add_option(
        "--blob_hash", blob_hash_hex, "versioned blob hash, may be repeated");
    auto *const overrides =
        cli.add_option_group("overrides", "change single preset values");
    overrides->add_option(
        "--max_data_size", max_data_size, "bound on header plus data size");
    overrides->add_option("--delay_blocks", delay_blocks, "strict delay");
    overrides->add_option("--future_blocks", future_blocks, "future bound");
    overrides->add_option(
        "--delay_seconds", delay_seconds, "strict delay in seconds");
    overrides->add_option(
        "--future_seconds", future_seconds, "future bound in seconds");
    overrides->add_flag(
        "--fee_token", fee_token, "host chain pays fees in a custom token");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const data = evmc::from_hex(data_hex);
    if (INBOX_UNLIKELY(!data.has_value())) {
        LOG_ERROR("--data is not valid hex");
        return EXIT_FAILURE;
    }
    std::vector<bytes32_t> blob_hashes;
    for (auto const &hex : blob_hash_hex) {
        auto const hash = evmc::from_hex<bytes32_t>(hex);
        if (INBOX_UNLIKELY(!hash.has_value())) {
            LOG_ERROR("--blob_hash {} is not a 32 byte hex value", hex);
            return EXIT_FAILURE;
        }
        blob_hashes.push_back(*hash);
    }
    if (INBOX_UNLIKELY(!blob_hashes.empty() && !data->empty())) {
        LOG_ERROR("--data and --blob_hash are mutually exclusive");
        return EXIT_FAILURE;
    }

    auto const chain = make_chain(chain_config);
    evmc_tx_context ctx{};
    ctx.block_number = static_cast<int64_t>(block_number);
    ctx.block_timestamp = static_cast<int64_t>(timestamp);
    ctx.chain_id = intx::be::store<evmc::uint256be>(chain->get_chain_id());

    LOG_INFO(
        "Running with block = {}, timestamp = {}, delayed = {}, age = {}",
        block_number,
        timestamp,
        delayed,
        age);

    InboxConfig config = chain->get_inbox_config();
    if (max_data_size.has_value()) {
        config.max_data_size = *max_data_size;
    }
    if (delay_blocks.has_value()) {
        config.max_time_variation.delay_blocks = *delay_blocks;
    }
    if (future_blocks.has_value()) {
        config.max_time_variation.future_blocks = *future_blocks;
    }
    if (delay_seconds.has_value()) {
        config.max_time_variation.delay_seconds = *delay_seconds;
    }
    if (future_seconds.has_value()) {
        config.max_time_variation.future_seconds = *future_seconds;
    }
    config.is_using_fee_token = config.is_using_fee_token || fee_token;

    auto const result =
        simulate(config, ctx, delayed, age, *data, blob_hashes);
    if (INBOX_UNLIKELY(result.has_error())) {
        LOG_ERROR(
            "batch rejected: {}", result.assume_error().message().c_str());
        return EXIT_FAILURE;
    }

    auto const &submission = result.assume_value();
    LOG_INFO(
        "header    = 0x{}", evmc::hex(to_byte_string_view(submission.header)));
    LOG_INFO("data hash = {}", submission.data_hash);
    LOG_INFO("batch acc = {}", submission.acc);
    return EXIT_SUCCESS;
}
