#ifndef TICKBACK_CORE_ERRORS_H
#define TICKBACK_CORE_ERRORS_H

#ifdef __cplusplus
extern "C" {
#endif

typedef enum TickbackStatus {
    TICKBACK_OK = 0,
    TICKBACK_ERR_PARSE = 1,
    TICKBACK_ERR_IO = 2,
    TICKBACK_ERR_RANGE = 3,
    TICKBACK_ERR_PROTO = 4,
    TICKBACK_ERR_NOMEM = 5,
    TICKBACK_ERR_INVALID = 6
} TickbackStatus;

#ifdef __cplusplus
}
#endif

#endif // TICKBACK_CORE_ERRORS_H
