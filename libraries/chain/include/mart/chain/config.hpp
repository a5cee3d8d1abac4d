#pragma once

#define MART_BLOCKCHAIN_PRECISION                          100000
#define MART_MAX_SHARE_SUPPLY                              int64_t(1000000000000000ll)

/** the native currency of the host ledger is always an approved currency */
#define MART_NATIVE_CURRENCY                               "native"
#define MART_MAX_PRICE                                     (int64_t(1000000000ll)*MART_BLOCKCHAIN_PRECISION)

#define MART_100_PERCENT                                   10000
#define MART_DEFAULT_TRANSACTION_FEE                       200 // 2%

/** storage deposit required per listing or offer an account holds */
#define MART_STORAGE_UNIT_COST                             859

/** payout maps may fall short of the price by this much to absorb rounding in the registry */
#define MART_PAYOUT_TOLERANCE                              100
#define MART_MAX_PAYOUT_RECIPIENTS                         10

/** administrative and destructive calls must attach exactly this much */
#define MART_CONFIRMATION_DEPOSIT                          1

#define MART_KEY_DELIMITER                                 "||"

#define MART_DEFAULT_MARKET_ACCOUNT                        "market"
#define MART_GENESIS_TIMESTAMP                             1431700000
#define MART_BLOCK_INTERVAL                                5 /* seconds */
#define MART_MAX_NAME_LENGTH                               64
