#pragma once

/*compile-time defaults, every value can be overridden from ~/.vichatrc or the command line*/

#ifndef VICHAT_DEFAULT_HOST
#define VICHAT_DEFAULT_HOST "irc.chat.twitch.tv"
#endif
#ifndef VICHAT_DEFAULT_PORT
#define VICHAT_DEFAULT_PORT "6667"
#endif

#define VICHAT_HISTORY_CAP          1000
#define VICHAT_SEND_INTERVAL_MS     1500   // 20 messages / 30 s for regular users
#define VICHAT_BACKOFF_MIN_MS       500
#define VICHAT_BACKOFF_MAX_MS       30000
#define VICHAT_LIVENESS_TIMEOUT_S   300
#define VICHAT_PROBE_GRACE_S        10
#define VICHAT_HANDSHAKE_TIMEOUT_S  15
#define VICHAT_MAX_SEND_RETRIES     3

#define VICHAT_MAX_MESSAGE_BYTES    500
#define VICHAT_MAX_LINE_BYTES       (64 * 1024)
#define VICHAT_RC_NAME              ".vichatrc"
