#pragma once

/*compile-time tunables for the browser core*/

// number of independent panes (views)
#ifndef MDIR_PANE_COUNT
#define MDIR_PANE_COUNT 4
#endif

// scroll jump used when the cursor leaves the visible window.
// fixed page gesture, not derived from the requested amount.
#ifndef MDIR_PAGE_STEP
#define MDIR_PAGE_STEP 10
#endif

#define MDIR_RC_NAME ".mdirrc"
#define MDIR_LASTDIR_NAME ".mdir"
#define MDIR_DEFAULT_LOG "/tmp/mdir.log"
