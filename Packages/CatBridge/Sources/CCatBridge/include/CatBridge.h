#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Every call returns a malloc'd JSON envelope {"status": "ok" | "error", ...} that the
// caller releases with cat_free_string. Error envelopes carry "error" and "message".
char *cat_load_pool(const char *pool_json);
char *cat_start_session(const char *request_json);
char *cat_next_question(const char *session_id);
char *cat_submit_response(const char *session_id, const char *response_json);
char *cat_complete_session(const char *session_id);
char *cat_abandon_session(const char *session_id);
char *cat_session_state(const char *session_id);
void cat_reset(void);
void cat_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
