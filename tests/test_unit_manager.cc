#include <cassert>
#include <cstdio>

#include "UnitManager.hh"

using namespace prondict;

void
test_identity()
{
  UnitManager m;
  const Unit *aa = m.get_unit("AA", false);
  assert(aa != NULL);
  assert(aa->name() == "AA");
  assert(!aa->is_filler());
  assert(!aa->is_context_dependent());
  assert(m.get_unit("AA", false) == aa);

  const Unit *aa_filler = m.get_unit("AA", true);
  assert(aa_filler != aa);
  assert(aa_filler->is_filler());
  assert(m.get_unit("AA", true) == aa_filler);

  // Names are case sensitive
  assert(m.get_unit("aa", false) != aa);
}

void
test_base_ids()
{
  UnitManager m;
  // SIL is interned by the constructor
  assert(m.num_units() == 1);
  const Unit *a = m.get_unit("A", false);
  const Unit *b = m.get_unit("B", false);
  m.get_unit("A", false);
  assert(m.num_units() == 3);
  assert(a->base_id() == 1);
  assert(b->base_id() == 2);
  assert(m.unit(1) == a);
  assert(m.unit(2) == b);
}

void
test_silence()
{
  UnitManager m;
  const Unit *sil = m.silence();
  assert(sil->is_silence());
  assert(sil->is_filler());
  assert(sil->name() == Unit::SILENCE_NAME);
  assert(m.get_unit("SIL", true) == sil);

  const Unit *word_sil = m.get_unit("SIL", false);
  assert(word_sil != sil);
  assert(!word_sil->is_silence());
}

void
test_find()
{
  UnitManager m;
  assert(m.find_unit("K", false) == NULL);
  const Unit *k = m.get_unit("K", false);
  assert(m.find_unit("K", false) == k);
  assert(m.find_unit("K", true) == NULL);
}

int
main(int argc, char *argv[])
{
  test_identity();
  test_base_ids();
  test_silence();
  test_find();
  printf("test_unit_manager: ok\n");
  return 0;
}
