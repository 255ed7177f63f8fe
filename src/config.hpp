#pragma once

/*here you can tune the build-time defaults*/

#define PK_VERSION "0.3.0"

#ifndef PK_ENABLE_LOGGING
#define PK_ENABLE_LOGGING 1
#endif

// padding used by PanelBuilder when a decorated panel gets no explicit padding
#ifndef PK_DEFAULT_PADDING_H
#define PK_DEFAULT_PADDING_H 2
#endif
#ifndef PK_DEFAULT_PADDING_V
#define PK_DEFAULT_PADDING_V 1
#endif

#define PK_RC_NAME ".panelkitrc"
#define PK_LOG_ENV "PANELKIT_LOG"
#define PK_LOG_LEVEL_ENV "PANELKIT_LOG_LEVEL"
