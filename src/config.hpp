#pragma once

/*build-time defaults, runtime overrides come from the rc file*/

#ifndef UKE_RC_FILE
#define UKE_RC_FILE ".uketuirc"
#endif

#ifndef UKE_DEFAULT_COL_GAP
#define UKE_DEFAULT_COL_GAP 2
#endif

#ifndef UKE_DEFAULT_ROW_GAP
#define UKE_DEFAULT_ROW_GAP 1
#endif

#ifndef UKE_FINGER_GLYPH
#define UKE_FINGER_GLYPH '*'
#endif

#define UKE_OPEN_GLYPH  'O'
#define UKE_MUTED_GLYPH 'X'

#ifndef UKE_PRINT_WIDTH
#define UKE_PRINT_WIDTH 80
#endif
