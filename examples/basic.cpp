// Pledge - Basic Example
// Runs one lending lifecycle: provide, borrow, price drop, trigger, liquidate

#include <pledge/protocol.hpp>
#include <pledge/log.hpp>
#include <iostream>

using namespace pledge;

namespace {

const Address OWNER = addresses::from_id(1);
const Address LENDER = addresses::from_id(100);
const Address BORROWER = addresses::from_id(200);
const Address KEEPER = addresses::from_id(300);
const Address ARTWORKS = addresses::from_id(0xA000);

void print_pool(const Protocol& protocol) {
    PoolInfo info = protocol.pool().pool_info();
    std::cout << "  liquidity=" << x18::to_string(info.state.total_liquidity_x18)
              << " borrowed=" << x18::to_string(info.state.total_borrowed_x18)
              << " reserves=" << x18::to_string(info.state.total_reserves_x18)
              << " utilization=" << x18::to_string(info.utilization_x18)
              << " rate=" << x18::to_string(info.current_rate_x18) << "\n";
}

bool ok(int32_t rc, const char* what) {
    if (rc != errors::OK) {
        std::cerr << what << " failed: " << errors::name(rc) << "\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Config config;
    try {
        if (argc > 1) {
            config = Config::from_file(argv[1]);
        }
        log::init(config.general.log_level);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    ManualClock clock;
    InMemoryBalances balances;
    InMemoryCustody custody;
    balances.credit(LENDER, x18::from_int(100000));
    balances.credit(KEEPER, x18::from_int(1000));

    Protocol protocol(config, OWNER, balances, custody, clock);
    protocol.set_event_callback([](const Event& event) {
        std::cout << "  event " << event_name(event.kind) << " #" << event.subject_id
                  << " " << x18::to_string(event.amount0_x18) << "\n";
    });

    // Listing: oracle support, floor price, facade allow-list
    AssetRef piece{ARTWORKS, 7};
    if (!ok(protocol.oracle().set_asset_class_support(OWNER, ARTWORKS, true), "support") ||
        !ok(protocol.oracle().set_floor_price(OWNER, ARTWORKS, x18::from_int(10)), "floor price") ||
        !ok(protocol.set_asset_allowed(OWNER, ARTWORKS, true), "allow-list") ||
        !ok(custody.mint(piece, BORROWER), "mint")) {
        return 1;
    }

    std::cout << "Providing liquidity...\n";
    ProvideResult provided = protocol.pool().provide(LENDER, x18::from_int(100000));
    if (!ok(provided.error_code, "provide")) return 1;
    std::cout << "  shares=" << x18::to_string(provided.shares_x18) << "\n";

    std::cout << "\nBorrowing 8 against an asset worth 10...\n";
    BorrowResult borrowed = protocol.deposit_and_borrow(BORROWER, piece, x18::from_int(8),
                                                        30 * SECONDS_PER_DAY);
    if (borrowed.error_code != errors::OK) {
        std::cerr << "Borrow failed: " << errors::name(borrowed.error_code) << "\n";
        return 1;
    }
    print_pool(protocol);

    std::cout << "\nFloor drops to 3...\n";
    if (!ok(protocol.oracle().set_floor_price(OWNER, ARTWORKS, x18::from_int(3)), "floor price")) {
        return 1;
    }
    clock.advance(SECONDS_PER_DAY);

    LiquidationResult triggered = protocol.liquidation().trigger(KEEPER, borrowed.position_id);
    std::cout << "  trigger: " << errors::name(triggered.error_code)
              << " debt=" << x18::to_string(triggered.debt_x18)
              << " bonus=" << x18::to_string(triggered.bonus_x18) << "\n";

    LiquidationResult early = protocol.liquidation().execute(KEEPER, borrowed.position_id);
    std::cout << "  execute before delay: " << errors::name(early.error_code) << "\n";

    clock.advance(protocol.liquidation().remaining_delay(borrowed.position_id));
    LiquidationResult executed = protocol.liquidation().execute(KEEPER, borrowed.position_id);
    std::cout << "  execute after delay: " << errors::name(executed.error_code) << "\n";

    auto holder = custody.holder_of(piece);
    std::cout << "\nAsset now held by " << (holder ? addresses::to_hex(*holder) : "nobody") << "\n";
    print_pool(protocol);

    ProtocolInfo info = protocol.protocol_info();
    std::cout << "Active positions: " << info.active_positions
              << ", active loans: " << info.active_loans << "\n";
    return 0;
}
