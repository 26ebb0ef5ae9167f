#pragma once

// warden_cli sanitize <text> [max_len]
int cmd_sanitize(int argc, char** argv);

// warden_cli gate <request.json> <grants.json>
int cmd_gate(int argc, char** argv);
