#pragma once

namespace rcs::app
{

// Runs the rclone-supervisor command line tool.
//
//   rclone-supervisor [endpoint [json-payload]]
//
// Launches `rclone rcd`, waits for it to serve and either issues one remote
// control call or keeps the daemon alive until SIGINT/SIGTERM.
int supervisor_main(int argc, char *argv[]);

} // namespace rcs::app
