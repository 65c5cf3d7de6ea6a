#pragma once

#define OCEX_ADDRESS_PREFIX "OCX"

/** module id the custodian account is derived from */
#define OCEX_DEFAULT_MODULE_ID "OCEX_LMP"

/** a main account counts itself as its first proxy */
#define OCEX_DEFAULT_MAX_PROXIES_PER_ACCOUNT    3

#define OCEX_DEFAULT_ON_CHAIN_EVENTS_LIMIT      500

/** fee entries paid out by a single collect_fees call */
#define OCEX_DEFAULT_FEE_BATCH_LIMIT            3
#define OCEX_DEFAULT_FEE_CONVERSION_FACTOR      1

#define OCEX_DEFAULT_SNAPSHOT_ACCOUNT_LIMIT     1000
#define OCEX_DEFAULT_WITHDRAWAL_LIMIT           50
#define OCEX_DEFAULT_ASSETS_LIMIT               1000

#define OCEX_DEFAULT_ACCEPTED_QUOTE_STATUS      "OK"

#define OCEX_MAX_NESTED_OBJECTS                 (200)
