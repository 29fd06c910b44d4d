// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/types/eip712_envelope.hpp>
#include <txcodec/core/types/evmc_bytes32.hpp>
#include <txcodec/infra/cli/common.hpp>
#include <txcodec/infra/common/log.hpp>
#include <txcodec/rpc/json/eip712_envelope.hpp>
#include <txcodec/rpc/json/receipt.hpp>

namespace fs = std::filesystem;
using namespace txcodec;

static std::optional<nlohmann::json> load_json(const fs::path& path) {
    std::ifstream input{path};
    if (!input) {
        TXC_ERROR << "cannot open " << path.string();
        return std::nullopt;
    }
    nlohmann::json json = nlohmann::json::parse(input, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        TXC_ERROR << "invalid JSON in " << path.string();
        return std::nullopt;
    }
    return json;
}

static int decode_raw(const std::string& hex) {
    const auto bytes{from_hex(hex)};
    if (!bytes) {
        TXC_ERROR << "invalid hex input";
        return 1;
    }
    const auto envelope{decode_eip712_envelope(*bytes)};
    if (!envelope) {
        TXC_ERROR << "decode-raw failed: " << magic_enum::enum_name(envelope.error());
        return 1;
    }
    TXC_DEBUG << envelope->to_string();
    const nlohmann::json json = *envelope;
    std::cout << json.dump(2) << "\n";
    return 0;
}

static int decode_json(const fs::path& path) {
    const auto json{load_json(path)};
    if (!json) {
        return 1;
    }
    const auto envelope{rpc::decode_envelope_json(*json)};
    if (!envelope) {
        TXC_ERROR << "decode-json failed: " << magic_enum::enum_name(envelope.error());
        return 1;
    }

    Bytes broadcast;
    rlp::encode(broadcast, *envelope);
    Bytes signing;
    envelope->encode_for_signing(signing);

    std::cout << "broadcast: " << to_hex(broadcast, /*with_prefix=*/true) << "\n";
    std::cout << "signing:   " << to_hex(signing, /*with_prefix=*/true) << "\n";
    std::cout << "hash:      " << to_hex(envelope->hash(), /*with_prefix=*/true) << "\n";
    return 0;
}

static int decode_receipt(const fs::path& path) {
    const auto json{load_json(path)};
    if (!json) {
        return 1;
    }
    const auto receipt{rpc::decode_receipt_json(*json)};
    if (!receipt) {
        TXC_ERROR << "decode-receipt failed: " << magic_enum::enum_name(receipt.error());
        return 1;
    }
    TXC_DEBUG << receipt->to_string();
    const nlohmann::json normalised = *receipt;
    std::cout << normalised.dump(2) << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"EIP-712 envelope and receipt codec tool"};
    app.require_subcommand(1);

    log::Settings log_settings;
    cmd::common::add_logging_options(app, log_settings);

    std::string raw_hex;
    auto* cmd_raw = app.add_subcommand("decode-raw", "Decode a raw 0x71 envelope and print its JSON form");
    cmd_raw->add_option("hex", raw_hex, "Hex-encoded envelope bytes")->required();

    std::string envelope_file;
    auto* cmd_json = app.add_subcommand("decode-json", "Decode an envelope JSON file and print its encodings");
    cmd_json->add_option("file", envelope_file, "Path to the envelope JSON")->required()->check(CLI::ExistingFile);

    std::string receipt_file;
    auto* cmd_receipt = app.add_subcommand("decode-receipt", "Decode a receipt JSON file and print it normalised");
    cmd_receipt->add_option("file", receipt_file, "Path to the receipt JSON")->required()->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv)

    log::init(log_settings);

    int rc{0};
    try {
        if (*cmd_raw) {
            rc = decode_raw(raw_hex);
        } else if (*cmd_json) {
            rc = decode_json(envelope_file);
        } else if (*cmd_receipt) {
            rc = decode_receipt(receipt_file);
        }
    } catch (const std::exception& ex) {
        TXC_ERROR << ex.what();
        rc = 1;
    }
    return rc;
}
