#pragma once

/*here you can tune the editor core limits*/

#ifndef SE_PASTE_LIMIT
#define SE_PASTE_LIMIT (512ull * 1024ull * 1024ull)
#endif

#ifndef SE_WRITE_CHUNK_SIZE
#define SE_WRITE_CHUNK_SIZE (64u * 1024u)
#endif

#ifndef SE_RC_NAME
#define SE_RC_NAME ".snapeditrc"
#endif
