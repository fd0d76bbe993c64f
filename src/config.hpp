#pragma once

/*here you can choose the text buffer backend*/

#define TB_BACKEND_VECTOR 1
#define TB_BACKEND_ROPE   3

#ifndef TB_BACKEND
#define TB_BACKEND TB_BACKEND_ROPE
#endif

#if TB_BACKEND == TB_BACKEND_VECTOR
#define TB_BACKEND_NAME "vector"
#elif TB_BACKEND == TB_BACKEND_ROPE
#define TB_BACKEND_NAME "rope"
#else
#error "unknown TB_BACKEND"
#endif

/*buffered write size used by TextBuffer::write_file*/
#ifndef TB_WRITE_CHUNK_SIZE
#define TB_WRITE_CHUNK_SIZE (64 * 1024)
#endif

/*runtime options, changed with :set and ~/.glyphrc*/
struct Options {
  int tab_width = 4;
  bool expand_tab = true;
  bool auto_indent = false;
  bool show_line_numbers = false;
  bool enable_color = true;
};
